#ifndef TENSORIZER_TORCH_ERRORS_HPP
#define TENSORIZER_TORCH_ERRORS_HPP

#include <c10/util/Exception.h>

#include "tensorizer/torch/exports.h"

/// Throw one of the error types below, recording the current source location
/// the same way `C10_THROW_ERROR` does for the c10 errors.
#define TENSORIZER_TORCH_THROW(error_type, message)                             \
    throw ::tensorizer_torch::error_type(                                       \
        {__func__, __FILE__, static_cast<uint32_t>(__LINE__)}, message          \
    )

namespace tensorizer_torch {

/// The torch dtype needs quantization parameters (scale, zero point, ...)
/// that can not be stored next to the data, so it can not be serialized.
class TENSORIZER_TORCH_EXPORT UnsupportedDtypeError: public c10::NotImplementedError {
public:
    using c10::NotImplementedError::NotImplementedError;
    ~UnsupportedDtypeError() override;
};

/// There is no integer type with the same element size, so the data can not
/// be stored as opaque bytes.
class TENSORIZER_TORCH_EXPORT UnrepresentableWidthError: public c10::ValueError {
public:
    using c10::ValueError::ValueError;
    ~UnrepresentableWidthError() override;
};

/// A numpy dtype without corresponding torch dtype.
class TENSORIZER_TORCH_EXPORT UnrepresentableDtypeError: public c10::TypeError {
public:
    using c10::TypeError::TypeError;
    ~UnrepresentableDtypeError() override;
};

/// Opaque data, or a dtype name, without torch dtype to decode it.
class TENSORIZER_TORCH_EXPORT MissingTypeTagError: public c10::ValueError {
public:
    using c10::ValueError::ValueError;
    ~MissingTypeTagError() override;
};

/// The torch dtype name is malformed, or does not name a dtype.
class TENSORIZER_TORCH_EXPORT InvalidDtypeNameError: public c10::ValueError {
public:
    using c10::ValueError::ValueError;
    ~InvalidDtypeNameError() override;
};

}

#endif
