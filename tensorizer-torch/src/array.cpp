#include <torch/torch.h>

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

#include "tensorizer/torch/array.hpp"

using namespace tensorizer_torch;

[[noreturn]] static void dtype_not_understood(const std::string& descr) {
    C10_THROW_ERROR(TypeError, "data type '" + descr + "' not understood");
}

NpyDtype NpyDtype::parse(const std::string& descr) {
    size_t i = 0;
    char byteorder = '=';
    if (!descr.empty() && (descr[0] == '<' || descr[0] == '>' || descr[0] == '|' || descr[0] == '=')) {
        byteorder = descr[0];
        i += 1;
    }

    if (i >= descr.size()) {
        dtype_not_understood(descr);
    }
    char kind = descr[i];
    i += 1;

    // the size is mandatory, and must only contain digits
    if (i >= descr.size() || descr.size() - i > 9) {
        dtype_not_understood(descr);
    }
    size_t count = 0;
    for (; i < descr.size(); i++) {
        if (descr[i] < '0' || descr[i] > '9') {
            dtype_not_understood(descr);
        }
        count = count * 10 + static_cast<size_t>(descr[i] - '0');
    }

    size_t itemsize = count;
    switch (kind) {
    case 'b':
        if (count != 1) {
            dtype_not_understood(descr);
        }
        break;
    case 'i':
    case 'u':
        if (count != 1 && count != 2 && count != 4 && count != 8) {
            dtype_not_understood(descr);
        }
        break;
    case 'f':
        if (count != 2 && count != 4 && count != 8) {
            dtype_not_understood(descr);
        }
        break;
    case 'c':
        if (count != 8 && count != 16) {
            dtype_not_understood(descr);
        }
        break;
    case 'V':
    case 'S':
        if (count == 0) {
            dtype_not_understood(descr);
        }
        break;
    case 'U':
        // the size of unicode strings is given in characters
        if (count == 0) {
            dtype_not_understood(descr);
        }
        itemsize = 4 * count;
        break;
    default:
        dtype_not_understood(descr);
    }

    if (itemsize == 1 || kind == 'V' || kind == 'S') {
        byteorder = '|';
    } else if (byteorder == '=' || byteorder == '|') {
        byteorder = NpyDtype::native_byteorder();
    }

    return NpyDtype{byteorder, kind, itemsize};
}

char NpyDtype::native_byteorder() {
    static bool is_little_endian = [] {
        uint16_t x = 0x1;
        return *reinterpret_cast<uint8_t*>(&x) == 0x1;
    }();
    return is_little_endian ? '<' : '>';
}

std::string NpyDtype::str() const {
    auto count = this->kind == 'U' ? this->itemsize / 4 : this->itemsize;
    return std::string(1, this->byteorder) + this->kind + std::to_string(count);
}

std::string NpyDtype::name() const {
    auto bits = std::to_string(8 * this->itemsize);
    switch (this->kind) {
    case 'b':
        return "bool";
    case 'i':
        return "int" + bits;
    case 'u':
        return "uint" + bits;
    case 'f':
        return "float" + bits;
    case 'c':
        return "complex" + bits;
    case 'V':
        return "void" + bits;
    case 'S':
        return "bytes" + bits;
    case 'U':
        return "str" + bits;
    default:
        return this->str();
    }
}

/******************************************************************************/

static size_t checked_numel(const std::vector<int64_t>& shape) {
    size_t count = 1;
    for (auto dim: shape) {
        if (dim < 0) {
            C10_THROW_ERROR(ValueError, "negative dimensions are not allowed");
        }
    }

    for (auto dim: shape) {
        if (dim == 0) {
            return 0;
        }
        if (count > std::numeric_limits<size_t>::max() / static_cast<size_t>(dim)) {
            C10_THROW_ERROR(ValueError, "array is too big, the number of elements overflows");
        }
        count *= static_cast<size_t>(dim);
    }
    return count;
}

// number of bytes in an array of the given shape, which must fit in the
// int64_t used for tensor sizes and strides
static size_t checked_nbytes(const std::vector<int64_t>& shape, size_t itemsize) {
    auto count = checked_numel(shape);
    auto max_bytes = static_cast<size_t>(std::numeric_limits<int64_t>::max());
    if (itemsize != 0 && count > max_bytes / itemsize) {
        C10_THROW_ERROR(ValueError,
            "array is too big, the size in bytes of " + std::to_string(count) +
            " elements of " + std::to_string(itemsize) + " bytes overflows"
        );
    }
    return count * itemsize;
}

static std::vector<int64_t> c_contiguous_strides(const std::vector<int64_t>& shape, size_t itemsize) {
    auto strides = std::vector<int64_t>(shape.size(), 0);
    auto stride = static_cast<int64_t>(itemsize);
    for (size_t i = shape.size(); i > 0; i--) {
        strides[i - 1] = stride;
        auto dim = std::max<int64_t>(shape[i - 1], 1);
        if (i > 1 && stride > std::numeric_limits<int64_t>::max() / dim) {
            C10_THROW_ERROR(ValueError, "array is too big, the strides overflow");
        }
        stride *= dim;
    }
    return strides;
}

NpyArray::NpyArray(
    NpyDtype dtype,
    std::vector<int64_t> shape,
    std::vector<int64_t> strides,
    void* data,
    std::shared_ptr<void> base
):
    dtype_(dtype),
    shape_(std::move(shape)),
    strides_(std::move(strides)),
    data_(data),
    base_(std::move(base))
{
    if (shape_.size() != strides_.size()) {
        C10_THROW_ERROR(ValueError,
            "shape and strides must have the same length, got " +
            std::to_string(shape_.size()) + " and " + std::to_string(strides_.size())
        );
    }
    checked_nbytes(shape_, dtype_.itemsize);
}

NpyArray NpyArray::empty(NpyDtype dtype, std::vector<int64_t> shape) {
    auto nbytes = checked_nbytes(shape, dtype.itemsize);
    // always allocate at least one byte, so data is never a null pointer
    auto buffer = std::make_shared<std::vector<uint8_t>>(std::max<size_t>(nbytes, 1));
    auto strides = c_contiguous_strides(shape, dtype.itemsize);
    return NpyArray(dtype, std::move(shape), std::move(strides), buffer->data(), buffer);
}

NpyArray NpyArray::from_buffer(
    NpyDtype dtype,
    std::vector<int64_t> shape,
    void* data,
    size_t size,
    size_t offset,
    std::shared_ptr<void> base
) {
    if (data == nullptr && size != 0) {
        C10_THROW_ERROR(ValueError, "got a null buffer with non-zero size");
    }

    if (offset > size) {
        C10_THROW_ERROR(ValueError,
            "offset must be non-negative and no greater than buffer length (" +
            std::to_string(size) + ")"
        );
    }

    auto needed = checked_nbytes(shape, dtype.itemsize);
    if (needed > size - offset) {
        C10_THROW_ERROR(TypeError,
            "buffer is too small for requested array: need " + std::to_string(needed) +
            " bytes, but only " + std::to_string(size - offset) + " are available"
        );
    }

    auto strides = c_contiguous_strides(shape, dtype.itemsize);
    auto* start = static_cast<uint8_t*>(data) + offset;
    return NpyArray(dtype, std::move(shape), std::move(strides), start, std::move(base));
}

size_t NpyArray::numel() const {
    return checked_numel(shape_);
}

size_t NpyArray::nbytes() const {
    return checked_nbytes(shape_, dtype_.itemsize);
}

bool NpyArray::is_c_contiguous() const {
    if (this->numel() == 0) {
        return true;
    }

    auto expected = c_contiguous_strides(shape_, dtype_.itemsize);
    for (size_t i = 0; i < shape_.size(); i++) {
        // the stride of dimensions with a single entry does not matter
        if (shape_[i] != 1 && strides_[i] != expected[i]) {
            return false;
        }
    }
    return true;
}

/******************************************************************************/

torch::optional<NpyDtype> tensorizer_torch::array_dtype_for(torch::Dtype dtype) {
    auto native = NpyDtype::native_byteorder();
    switch (dtype) {
    case torch::kBool:
        return NpyDtype{'|', 'b', 1};
    case torch::kInt8:
        return NpyDtype{'|', 'i', 1};
    case torch::kInt16:
        return NpyDtype{native, 'i', 2};
    case torch::kInt32:
        return NpyDtype{native, 'i', 4};
    case torch::kInt64:
        return NpyDtype{native, 'i', 8};
    case torch::kUInt8:
        return NpyDtype{'|', 'u', 1};
    case c10::ScalarType::UInt16:
        return NpyDtype{native, 'u', 2};
    case c10::ScalarType::UInt32:
        return NpyDtype{native, 'u', 4};
    case c10::ScalarType::UInt64:
        return NpyDtype{native, 'u', 8};
    case torch::kFloat16:
        return NpyDtype{native, 'f', 2};
    case torch::kFloat32:
        return NpyDtype{native, 'f', 4};
    case torch::kFloat64:
        return NpyDtype{native, 'f', 8};
    case c10::ScalarType::ComplexFloat:
        return NpyDtype{native, 'c', 8};
    case c10::ScalarType::ComplexDouble:
        return NpyDtype{native, 'c', 16};
    default:
        return torch::nullopt;
    }
}

torch::optional<torch::Dtype> tensorizer_torch::torch_dtype_for(const NpyDtype& dtype) {
    switch (dtype.kind) {
    case 'b':
        return torch::kBool;
    case 'i':
        switch (dtype.itemsize) {
        case 1: return torch::kInt8;
        case 2: return torch::kInt16;
        case 4: return torch::kInt32;
        case 8: return torch::kInt64;
        default: return torch::nullopt;
        }
    case 'u':
        switch (dtype.itemsize) {
        case 1: return torch::kUInt8;
        case 2: return c10::ScalarType::UInt16;
        case 4: return c10::ScalarType::UInt32;
        case 8: return c10::ScalarType::UInt64;
        default: return torch::nullopt;
        }
    case 'f':
        switch (dtype.itemsize) {
        case 2: return torch::kFloat16;
        case 4: return torch::kFloat32;
        case 8: return torch::kFloat64;
        default: return torch::nullopt;
        }
    case 'c':
        switch (dtype.itemsize) {
        case 8: return c10::ScalarType::ComplexFloat;
        case 16: return c10::ScalarType::ComplexDouble;
        default: return torch::nullopt;
        }
    default:
        return torch::nullopt;
    }
}

NpyArray tensorizer_torch::tensor_to_array(const torch::Tensor& tensor) {
    if (!tensor.defined()) {
        C10_THROW_ERROR(ValueError, "can not convert an undefined tensor to numpy");
    }

    if (!tensor.device().is_cpu()) {
        C10_THROW_ERROR(TypeError,
            "can't convert " + tensor.device().str() + " device type tensor to numpy, "
            "use Tensor.cpu() to copy the tensor to host memory first"
        );
    }

    TORCH_CHECK(!tensor.requires_grad(),
        "can't call numpy() on a tensor that requires grad, use tensor.detach() first"
    );
    TORCH_CHECK(!tensor.is_conj(),
        "can't call numpy() on a tensor that has conjugate bit set, use tensor.resolve_conj() first"
    );
    TORCH_CHECK(!tensor.is_neg(),
        "can't call numpy() on a tensor that has negative bit set, use tensor.resolve_neg() first"
    );

    auto dtype = array_dtype_for(tensor.scalar_type());
    if (!dtype) {
        C10_THROW_ERROR(TypeError,
            "got unsupported ScalarType " + std::string(c10::toString(tensor.scalar_type()))
        );
    }

    auto itemsize = static_cast<int64_t>(dtype->itemsize);
    auto strides = tensor.strides().vec();
    for (auto& stride: strides) {
        stride *= itemsize;
    }

    return NpyArray(
        dtype.value(),
        tensor.sizes().vec(),
        std::move(strides),
        tensor.data_ptr(),
        std::make_shared<torch::Tensor>(tensor)
    );
}

torch::Tensor tensorizer_torch::array_to_tensor(const NpyArray& array) {
    const auto& dtype = array.dtype();
    auto scalar_type = torch_dtype_for(dtype);
    if (!scalar_type) {
        C10_THROW_ERROR(TypeError,
            "can't convert np.ndarray of type numpy." + dtype.name() + ". The only "
            "supported types are: float64, float32, float16, complex64, complex128, "
            "int64, int32, int16, int8, uint64, uint32, uint16, uint8, and bool."
        );
    }

    if (!dtype.is_native()) {
        C10_THROW_ERROR(ValueError,
            "given numpy array has byte order different from the native byte order. "
            "Conversion between byte orders is currently not supported."
        );
    }

    auto itemsize = static_cast<int64_t>(dtype.itemsize);
    auto strides = std::vector<int64_t>();
    strides.reserve(array.ndim());
    for (auto stride: array.strides()) {
        if (stride < 0) {
            C10_THROW_ERROR(ValueError,
                "at least one stride in the given numpy array is negative, "
                "and tensors with negative strides are not currently supported"
            );
        }
        if (stride % itemsize != 0) {
            C10_THROW_ERROR(ValueError,
                "given numpy array strides not a multiple of the element byte size"
            );
        }
        strides.push_back(stride / itemsize);
    }

    auto options = torch::TensorOptions().dtype(scalar_type.value()).device(torch::kCPU);
    if (array.data() == nullptr) {
        // nothing to share with an empty buffer
        return torch::empty_strided(array.shape(), strides, options);
    }

    auto base = array.base();
    return torch::from_blob(
        array.data(),
        array.shape(),
        strides,
        [base](void*) mutable {
            base.reset();
        },
        options
    );
}
