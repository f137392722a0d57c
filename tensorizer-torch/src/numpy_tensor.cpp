#include <torch/torch.h>

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

#include "tensorizer/torch/dtype.hpp"
#include "tensorizer/torch/errors.hpp"
#include "tensorizer/torch/numpy_tensor.hpp"

using namespace tensorizer_torch;

NumpyTensorHolder::NumpyTensorHolder(
    NpyArray data,
    std::string numpy_dtype,
    torch::optional<std::string> torch_dtype
):
    data_(std::move(data)),
    numpy_dtype_(std::move(numpy_dtype)),
    torch_dtype_(std::move(torch_dtype))
{}

NumpyTensor NumpyTensorHolder::from_tensor(torch::Tensor tensor) {
    if (!tensor.defined()) {
        C10_THROW_ERROR(ValueError, "can not serialize an undefined tensor");
    }

    auto dtype = tensor.scalar_type();
    if (is_unsupported(dtype)) {
        TENSORIZER_TORCH_THROW(UnsupportedDtypeError,
            "serialization for " + dtype_name(dtype) + " is not implemented"
        );
    }

    auto torch_dtype = dtype_name(dtype);
    tensor = tensor.cpu().detach();

    if (!is_asymmetric(dtype)) {
        if (array_dtype_for(dtype).has_value()) {
            auto array = tensor_to_array(tensor);
            auto numpy_dtype = array.dtype().str();
            return torch::make_intrusive<NumpyTensorHolder>(
                std::move(array), std::move(numpy_dtype), std::move(torch_dtype)
            );
        }

        // not a known asymmetric type, but numpy can not represent it either.
        // Fall back to storing it as opaque data.
        TORCH_WARN(
            "numpy has no dtype corresponding to ", torch_dtype,
            ", the data will be stored as opaque data"
        );
    }

    // viewing as integers would drop the lazy conjugation or negation
    TORCH_CHECK(!tensor.is_conj() && !tensor.is_neg(),
        "can not store a tensor with the conjugate or negative bit set as opaque data, "
        "use tensor.resolve_conj() and tensor.resolve_neg() first"
    );

    // masquerade as an integer of the same size, and mark the data as opaque
    auto element_size = static_cast<size_t>(tensor.element_size());
    auto array = tensor_to_array(tensor.view(opaque_storage_dtype(element_size)));
    auto numpy_dtype = array.dtype().str();
    std::replace(numpy_dtype.begin(), numpy_dtype.end(), 'i', 'V');

    return torch::make_intrusive<NumpyTensorHolder>(
        std::move(array), std::move(numpy_dtype), std::move(torch_dtype)
    );
}

NumpyTensor NumpyTensorHolder::from_array(NpyArray array) {
    auto torch_dtype = std::string();
    try {
        // an array without elements, to check the dtype without allocating
        auto itemsize = static_cast<int64_t>(array.dtype().itemsize);
        auto probe = NpyArray(array.dtype(), {0}, {itemsize}, nullptr, nullptr);
        torch_dtype = dtype_name(array_to_tensor(probe).scalar_type());
    } catch (const c10::TypeError& e) {
        // if something was serialized with this dtype, it could not be
        // deserialized later
        TENSORIZER_TORCH_THROW(UnrepresentableDtypeError,
            "cannot serialize an array with dtype " + array.dtype().name() +
            " as a NumpyTensor: " + e.msg()
        );
    }

    auto numpy_dtype = array.dtype().str();
    return torch::make_intrusive<NumpyTensorHolder>(
        std::move(array), std::move(numpy_dtype), std::move(torch_dtype)
    );
}

NumpyTensor NumpyTensorHolder::from_buffer(
    const std::string& numpy_dtype,
    torch::optional<std::string> torch_dtype,
    std::vector<int64_t> shape,
    const torch::Tensor& buffer,
    size_t offset
) {
    if (!buffer.defined() || !buffer.device().is_cpu() || !buffer.is_contiguous()) {
        C10_THROW_ERROR(ValueError, "the buffer must be a contiguous tensor on CPU");
    }

    auto size = static_cast<size_t>(buffer.numel()) * static_cast<size_t>(buffer.element_size());
    auto data = NpyArray::from_buffer(
        NpyDtype::parse(decoder_dtype(numpy_dtype)),
        std::move(shape),
        buffer.data_ptr(),
        size,
        offset,
        std::make_shared<torch::Tensor>(buffer)
    );

    return torch::make_intrusive<NumpyTensorHolder>(
        std::move(data), numpy_dtype, std::move(torch_dtype)
    );
}

NumpyTensor NumpyTensorHolder::from_buffer(
    const std::string& numpy_dtype,
    torch::optional<std::string> torch_dtype,
    std::vector<int64_t> shape,
    void* data,
    size_t size,
    size_t offset
) {
    auto array = NpyArray::from_buffer(
        NpyDtype::parse(decoder_dtype(numpy_dtype)),
        std::move(shape),
        data,
        size,
        offset
    );

    return torch::make_intrusive<NumpyTensorHolder>(
        std::move(array), numpy_dtype, std::move(torch_dtype)
    );
}

torch::Tensor NumpyTensorHolder::to_tensor() const {
    if (!this->is_opaque()) {
        return array_to_tensor(data_);
    }

    if (!torch_dtype_.has_value() || torch_dtype_->empty()) {
        TENSORIZER_TORCH_THROW(MissingTypeTagError,
            "tried to decode a tensor stored as opaque data, but no torch dtype was specified"
        );
    }

    auto dtype = resolve_torch_dtype(torch_dtype_);
    if (is_unsupported(dtype)) {
        TENSORIZER_TORCH_THROW(UnsupportedDtypeError,
            "deserialization for " + torch_dtype_.value() + " is not implemented"
        );
    }

    if (c10::elementSize(dtype) != data_.dtype().itemsize) {
        C10_THROW_ERROR(ValueError,
            "opaque data with elements of " + std::to_string(data_.dtype().itemsize) +
            " bytes can not be decoded as " + torch_dtype_.value() + ", which uses " +
            std::to_string(c10::elementSize(dtype)) + " bytes per element"
        );
    }

    return array_to_tensor(data_).view(dtype);
}

bool NumpyTensorHolder::is_opaque() const {
    return tensorizer_torch::is_opaque(numpy_dtype_);
}

std::string NumpyTensorHolder::repr() const {
    std::ostringstream output;
    output << "NumpyTensor(numpy_dtype='" << numpy_dtype_ << "', torch_dtype=";
    if (torch_dtype_.has_value()) {
        output << "'" << torch_dtype_.value() << "'";
    } else {
        output << "None";
    }

    output << ", shape=[";
    const auto& shape = data_.shape();
    for (size_t i = 0; i < shape.size(); i++) {
        output << shape[i];
        if (i + 1 < shape.size()) {
            output << ", ";
        }
    }
    output << "])";

    return output.str();
}
