#include "tensorizer/torch/errors.hpp"

using namespace tensorizer_torch;

// out of line destructors, so the vtables and typeinfo of these classes are
// emitted (and exported) from this library only
UnsupportedDtypeError::~UnsupportedDtypeError() = default;
UnrepresentableWidthError::~UnrepresentableWidthError() = default;
UnrepresentableDtypeError::~UnrepresentableDtypeError() = default;
MissingTypeTagError::~MissingTypeTagError() = default;
InvalidDtypeNameError::~InvalidDtypeNameError() = default;
