#ifndef TENSORIZER_TORCH_HPP
#define TENSORIZER_TORCH_HPP

#include "tensorizer/torch/version.h"  // IWYU pragma: export
#include "tensorizer/torch/exports.h"  // IWYU pragma: export

#include "tensorizer/torch/errors.hpp"        // IWYU pragma: export
#include "tensorizer/torch/array.hpp"         // IWYU pragma: export
#include "tensorizer/torch/dtype.hpp"         // IWYU pragma: export
#include "tensorizer/torch/numpy_tensor.hpp"  // IWYU pragma: export
#include "tensorizer/torch/misc.hpp"          // IWYU pragma: export

#endif
