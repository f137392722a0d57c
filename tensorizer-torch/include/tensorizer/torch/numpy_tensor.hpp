#ifndef TENSORIZER_TORCH_NUMPY_TENSOR_HPP
#define TENSORIZER_TORCH_NUMPY_TENSOR_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <torch/script.h>

#include "tensorizer/torch/array.hpp"
#include "tensorizer/torch/exports.h"

namespace tensorizer_torch {

class NumpyTensorHolder;
/// TorchScript will always manipulate `NumpyTensorHolder` through a
/// `torch::intrusive_ptr`
using NumpyTensor = torch::intrusive_ptr<NumpyTensorHolder>;

/// A numpy array holding the data of a torch tensor, together with the
/// numpy and torch dtypes needed to store it and to convert it back to a
/// tensor later.
///
/// Tensors with a dtype numpy can not represent (`torch.bfloat16`,
/// `torch.complex32`, ...) are stored as opaque data: the numpy array uses
/// an integer type of the same size, and `numpy_dtype` is the corresponding
/// `void` type (`"<V2"` for `"<i2"`). The original dtype is then recovered
/// from `torch_dtype` when calling `to_tensor()`.
///
/// The array always shares memory with the tensor or buffer it was created
/// from. Instances created over a raw pointer do not keep that memory alive.
class TENSORIZER_TORCH_EXPORT NumpyTensorHolder final: public torch::CustomClassHolder {
public:
    NumpyTensorHolder(NpyArray data, std::string numpy_dtype, torch::optional<std::string> torch_dtype);
    ~NumpyTensorHolder() override = default;

    /// Convert a tensor to a `NumpyTensor`, using opaque data if numpy can
    /// not represent the tensor's dtype. The tensor is moved to CPU and
    /// detached from the autograd graph first.
    ///
    /// Throws `UnsupportedDtypeError` for quantized tensors.
    static NumpyTensor from_tensor(torch::Tensor tensor);

    /// Wrap a numpy array into a `NumpyTensor`, finding the torch dtype
    /// corresponding to the array's dtype. Throws `UnrepresentableDtypeError`
    /// if there is no such dtype, since the data could not be converted back
    /// to a tensor later.
    static NumpyTensor from_array(NpyArray array);

    /// Decode the bytes in `buffer` (starting at `offset`) into a
    /// `NumpyTensor`, given the encoded numpy and torch dtypes and the shape
    /// of the data. `buffer` must be a contiguous CPU tensor, and is kept
    /// alive as long as the data is used.
    static NumpyTensor from_buffer(
        const std::string& numpy_dtype,
        torch::optional<std::string> torch_dtype,
        std::vector<int64_t> shape,
        const torch::Tensor& buffer,
        size_t offset = 0
    );

    /// Same as above, for the `size` bytes starting at `data`. The data is
    /// not copied, and the caller must keep it alive while the
    /// `NumpyTensor` and the tensors created from it are in use.
    static NumpyTensor from_buffer(
        const std::string& numpy_dtype,
        torch::optional<std::string> torch_dtype,
        std::vector<int64_t> shape,
        void* data,
        size_t size,
        size_t offset = 0
    );

    /// Convert back to a tensor sharing memory with `data()`, reinterpreting
    /// opaque data as `torch_dtype`.
    torch::Tensor to_tensor() const;

    /// The numpy array holding the data
    const NpyArray& data() const {
        return data_;
    }

    /// The numpy dtype to store next to the data
    std::string numpy_dtype() const {
        return numpy_dtype_;
    }

    /// The torch dtype to store next to the data, if any
    torch::optional<std::string> torch_dtype() const {
        return torch_dtype_;
    }

    /// Is the data stored as opaque data, which can only be interpreted after
    /// converting it to a tensor with `to_tensor()`?
    bool is_opaque() const;

    /// Implementation of `__repr__` for TorchScript
    std::string repr() const;

private:
    NpyArray data_;
    std::string numpy_dtype_;
    torch::optional<std::string> torch_dtype_;
};

}

#endif
