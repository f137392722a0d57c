#ifndef TENSORIZER_TORCH_ARRAY_HPP
#define TENSORIZER_TORCH_ARRAY_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <torch/types.h>

#include "tensorizer/torch/exports.h"

namespace tensorizer_torch {

/// Element type of a numpy array, as described by the array protocol type
/// strings (`numpy.dtype.str`): a byte order character, a kind character and
/// a size, e.g. `"<f4"`, `"|b1"` or `"|V2"`.
struct TENSORIZER_TORCH_EXPORT NpyDtype {
    /// '<' (little endian), '>' (big endian) or '|' (not applicable)
    char byteorder = '|';
    /// 'b', 'i', 'u', 'f', 'c', 'V', 'S' or 'U'
    char kind = 'V';
    /// size of a single element, in bytes
    size_t itemsize = 0;

    /// Parse a type string like `"<f8"`, `"=i4"` or `"V2"`. Throws a
    /// `c10::TypeError` if numpy would not understand the string.
    static NpyDtype parse(const std::string& descr);

    /// Byte order character for multi-byte types on the current machine
    static char native_byteorder();

    /// The normalized type string, as returned by `numpy.dtype.str`
    std::string str() const;

    /// The numpy name of this dtype (`float32`, `bool`, `void16`, ...)
    std::string name() const;

    /// Is this dtype stored in the byte order of the current machine?
    bool is_native() const {
        return byteorder == '|' || byteorder == native_byteorder();
    }
};

inline bool operator==(const NpyDtype& lhs, const NpyDtype& rhs) {
    return lhs.byteorder == rhs.byteorder && lhs.kind == rhs.kind && lhs.itemsize == rhs.itemsize;
}

inline bool operator!=(const NpyDtype& lhs, const NpyDtype& rhs) {
    return !(lhs == rhs);
}

/// A strided view over memory, following numpy's `ndarray` model. The array
/// does not copy the memory it points to, and only keeps it alive through
/// `base()` when it is set. Views created over a caller-owned buffer without
/// `base` require the buffer to outlive the array.
class TENSORIZER_TORCH_EXPORT NpyArray {
public:
    /// Create a new view. `strides` are in bytes.
    NpyArray(
        NpyDtype dtype,
        std::vector<int64_t> shape,
        std::vector<int64_t> strides,
        void* data,
        std::shared_ptr<void> base
    );

    /// Allocate a new C-contiguous array with uninitialized elements. An
    /// empty `shape` creates a 0-dimensional array with a single element.
    static NpyArray empty(NpyDtype dtype, std::vector<int64_t> shape);

    /// Create a C-contiguous array over the `size` bytes starting at `data`,
    /// skipping the first `offset` bytes.
    static NpyArray from_buffer(
        NpyDtype dtype,
        std::vector<int64_t> shape,
        void* data,
        size_t size,
        size_t offset = 0,
        std::shared_ptr<void> base = nullptr
    );

    const NpyDtype& dtype() const {
        return dtype_;
    }

    const std::vector<int64_t>& shape() const {
        return shape_;
    }

    const std::vector<int64_t>& strides() const {
        return strides_;
    }

    void* data() const {
        return data_;
    }

    /// The object keeping the memory of this array alive, if any
    const std::shared_ptr<void>& base() const {
        return base_;
    }

    size_t ndim() const {
        return shape_.size();
    }

    /// Number of elements in the array
    size_t numel() const;

    /// Number of bytes taken by the elements in the array
    size_t nbytes() const;

    bool is_c_contiguous() const;

private:
    NpyDtype dtype_;
    std::vector<int64_t> shape_;
    std::vector<int64_t> strides_;
    void* data_;
    std::shared_ptr<void> base_;
};

/// Get the numpy dtype corresponding to `dtype`, if numpy supports it
/// natively. The returned dtype uses the native byte order.
TENSORIZER_TORCH_EXPORT torch::optional<NpyDtype> array_dtype_for(torch::Dtype dtype);

/// Get the torch dtype corresponding to the numpy `dtype`, if any.
TENSORIZER_TORCH_EXPORT torch::optional<torch::Dtype> torch_dtype_for(const NpyDtype& dtype);

/// Create a numpy array sharing memory with `tensor`, which must live on CPU
/// and not require gradients. This is the equivalent of `Tensor.numpy()`,
/// and throws a `c10::TypeError` if numpy can not represent the tensor dtype.
TENSORIZER_TORCH_EXPORT NpyArray tensor_to_array(const torch::Tensor& tensor);

/// Create a tensor sharing memory with `array`. This is the equivalent of
/// `torch.from_numpy`, and throws a `c10::TypeError` if torch can not
/// represent the array dtype.
TENSORIZER_TORCH_EXPORT torch::Tensor array_to_tensor(const NpyArray& array);

}

#endif
