#ifndef TENSORIZER_TORCH_MISC_HPP
#define TENSORIZER_TORCH_MISC_HPP

#include <string>

#include "tensorizer/torch/exports.h"

namespace tensorizer_torch {

/// Get the runtime version of tensorizer-torch as a string
TENSORIZER_TORCH_EXPORT std::string version();

}

#endif
