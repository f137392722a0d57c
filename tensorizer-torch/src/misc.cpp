#include "tensorizer/torch/version.h"
#include "tensorizer/torch/misc.hpp"

namespace tensorizer_torch {

std::string version() {
    return TENSORIZER_TORCH_VERSION;
}

} // namespace tensorizer_torch
