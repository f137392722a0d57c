#ifndef TENSORIZER_TORCH_DTYPE_HPP
#define TENSORIZER_TORCH_DTYPE_HPP

#include <cstddef>
#include <string>

#include <torch/types.h>

#include "tensorizer/torch/exports.h"

namespace tensorizer_torch {

/// Is the encoded numpy dtype opaque, i.e. generic data (numpy `void`)
/// without a meaningful interpretation?
TENSORIZER_TORCH_EXPORT bool is_opaque(const std::string& numpy_dtype);

/// Is `dtype` known not to have a corresponding numpy dtype? These dtypes are
/// stored as opaque data when serialized.
///
/// This check uses a hardcoded list of dtypes, up to date as of torch 2.3.
/// Any dtype added by later torch versions needs to be checked and added to
/// the list if numpy can not represent it.
TENSORIZER_TORCH_EXPORT bool is_asymmetric(torch::Dtype dtype);

/// Is serialization of `dtype` unsupported? These are the quantized dtypes,
/// which would require supplemental quantization parameters (scale, zero
/// point) to be deserialized correctly. All unsupported dtypes are also
/// asymmetric.
TENSORIZER_TORCH_EXPORT bool is_unsupported(torch::Dtype dtype);

/// Get the integer dtype with an element size of `element_size` bytes, used
/// to expose opaque data to numpy. Throws `UnrepresentableWidthError` for
/// sizes other than 1, 2, 4 or 8 bytes.
TENSORIZER_TORCH_EXPORT torch::Dtype opaque_storage_dtype(size_t element_size);

/// Convert an opaque numpy dtype (`"<V2"`) to one numpy can use to read data
/// from a buffer (`"<i2"`). Non-opaque dtypes are returned unchanged.
///
/// numpy accepts the `void` dtypes when creating an array from a buffer, but
/// ignores the byte order indicated in the type string, so opaque data is
/// always read as integers instead.
TENSORIZER_TORCH_EXPORT std::string decoder_dtype(const std::string& numpy_dtype);

/// Get the name of `dtype` as seen from Python, e.g. `"torch.float32"`.
TENSORIZER_TORCH_EXPORT std::string dtype_name(torch::Dtype dtype);

/// Parse a name of the form `"torch.<dtype>"` back into a dtype. This accepts
/// all the names created by `dtype_name`, as well as the aliases available in
/// Python (`"torch.float"`, `"torch.long"`, ...).
///
/// Throws `MissingTypeTagError` if the name is missing or empty, and
/// `InvalidDtypeNameError` if it is not of the form `"torch.<dtype>"`, or if
/// `<dtype>` is not the name of a dtype in the torch module.
TENSORIZER_TORCH_EXPORT torch::Dtype resolve_torch_dtype(const torch::optional<std::string>& name);

}

#endif
