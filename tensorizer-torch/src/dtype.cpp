#include <torch/torch.h>

#include <algorithm>
#include <array>
#include <string>
#include <unordered_map>

#include "tensorizer/torch/array.hpp"
#include "tensorizer/torch/dtype.hpp"
#include "tensorizer/torch/errors.hpp"

using namespace tensorizer_torch;

// The tables in this file are up to date as of torch 2.3. When updating torch,
// new dtypes should be added to TORCH_DTYPES, and to ASYMMETRIC_TYPES if numpy
// has no corresponding dtype.

/// torch dtypes without a numpy equivalent, which are stored as opaque data
static const std::array<torch::Dtype, 7> ASYMMETRIC_TYPES = {
    torch::kBFloat16,
    c10::ScalarType::QUInt8,
    c10::ScalarType::QInt8,
    c10::ScalarType::QInt32,
    c10::ScalarType::QUInt4x2,
    c10::ScalarType::QUInt2x4,
    c10::ScalarType::ComplexHalf,
};

/// These types are not supported since they require supplemental
/// quantization parameters to be deserialized correctly
static const std::array<torch::Dtype, 5> UNSUPPORTED_TYPES = {
    c10::ScalarType::QUInt8,
    c10::ScalarType::QInt8,
    c10::ScalarType::QInt32,
    c10::ScalarType::QUInt4x2,
    c10::ScalarType::QUInt2x4,
};

struct DtypeAttribute {
    const char* name;
    torch::Dtype dtype;
};

/// All the dtypes in the torch module. The first entry for a given dtype is
/// its canonical name, the others are aliases.
static const DtypeAttribute TORCH_DTYPES[] = {
    {"float32", torch::kFloat32},
    {"float64", torch::kFloat64},
    {"float16", torch::kFloat16},
    {"bfloat16", torch::kBFloat16},
    {"complex32", c10::ScalarType::ComplexHalf},
    {"complex64", c10::ScalarType::ComplexFloat},
    {"complex128", c10::ScalarType::ComplexDouble},
    {"uint8", torch::kUInt8},
    {"int8", torch::kInt8},
    {"int16", torch::kInt16},
    {"int32", torch::kInt32},
    {"int64", torch::kInt64},
    {"uint16", c10::ScalarType::UInt16},
    {"uint32", c10::ScalarType::UInt32},
    {"uint64", c10::ScalarType::UInt64},
    {"bool", torch::kBool},
    {"qint8", c10::ScalarType::QInt8},
    {"quint8", c10::ScalarType::QUInt8},
    {"qint32", c10::ScalarType::QInt32},
    {"quint4x2", c10::ScalarType::QUInt4x2},
    {"quint2x4", c10::ScalarType::QUInt2x4},
    {"float8_e5m2", c10::ScalarType::Float8_e5m2},
    {"float8_e4m3fn", c10::ScalarType::Float8_e4m3fn},
    {"float8_e5m2fnuz", c10::ScalarType::Float8_e5m2fnuz},
    {"float8_e4m3fnuz", c10::ScalarType::Float8_e4m3fnuz},
    {"bits1x8", c10::ScalarType::Bits1x8},
    {"bits2x4", c10::ScalarType::Bits2x4},
    {"bits4x2", c10::ScalarType::Bits4x2},
    {"bits8", c10::ScalarType::Bits8},
    {"bits16", c10::ScalarType::Bits16},
    // aliases
    {"float", torch::kFloat32},
    {"double", torch::kFloat64},
    {"half", torch::kFloat16},
    {"cfloat", c10::ScalarType::ComplexFloat},
    {"cdouble", c10::ScalarType::ComplexDouble},
    {"chalf", c10::ScalarType::ComplexHalf},
    {"short", torch::kInt16},
    {"int", torch::kInt32},
    {"long", torch::kInt64},
};

/// Some attributes of the torch module which exist but are not dtypes
static const std::array<const char*, 14> TORCH_OTHER_ATTRIBUTES = {
    "Tensor", "Size", "device", "dtype", "layout", "memory_format", "finfo",
    "iinfo", "nn", "cuda", "empty", "zeros", "tensor", "from_numpy",
};

template <typename Container>
static bool contains(const Container& container, torch::Dtype dtype) {
    return std::find(container.begin(), container.end(), dtype) != container.end();
}

bool tensorizer_torch::is_opaque(const std::string& numpy_dtype) {
    return NpyDtype::parse(numpy_dtype).kind == 'V';
}

bool tensorizer_torch::is_asymmetric(torch::Dtype dtype) {
    return contains(ASYMMETRIC_TYPES, dtype);
}

bool tensorizer_torch::is_unsupported(torch::Dtype dtype) {
    return contains(UNSUPPORTED_TYPES, dtype);
}

torch::Dtype tensorizer_torch::opaque_storage_dtype(size_t element_size) {
    switch (element_size) {
    case 1:
        return torch::kInt8;
    case 2:
        return torch::kInt16;
    case 4:
        return torch::kInt32;
    case 8:
        return torch::kInt64;
    default:
        TENSORIZER_TORCH_THROW(UnrepresentableWidthError,
            "cannot create a numpy array with opaque elements of size " +
            std::to_string(element_size) + " bytes"
        );
    }
}

std::string tensorizer_torch::decoder_dtype(const std::string& numpy_dtype) {
    if (!is_opaque(numpy_dtype)) {
        return numpy_dtype;
    }

    auto decoded = numpy_dtype;
    std::replace(decoded.begin(), decoded.end(), 'V', 'i');
    return decoded;
}

std::string tensorizer_torch::dtype_name(torch::Dtype dtype) {
    for (const auto& attribute: TORCH_DTYPES) {
        if (attribute.dtype == dtype) {
            return std::string("torch.") + attribute.name;
        }
    }

    C10_THROW_ERROR(ValueError,
        "unknown torch dtype " + std::string(c10::toString(dtype))
    );
}

/// Quick route for the opaque dtypes, which are the ones we need to decode
/// from their name most often
static const std::unordered_map<std::string, torch::Dtype>& decode_mapping() {
    static const auto MAPPING = [] {
        auto mapping = std::unordered_map<std::string, torch::Dtype>();
        for (auto dtype: ASYMMETRIC_TYPES) {
            mapping.emplace(dtype_name(dtype), dtype);
        }
        return mapping;
    }();
    return MAPPING;
}

torch::Dtype tensorizer_torch::resolve_torch_dtype(const torch::optional<std::string>& name) {
    if (name.has_value()) {
        const auto& mapping = decode_mapping();
        auto it = mapping.find(name.value());
        if (it != mapping.end()) {
            return it->second;
        }
    }

    if (!name.has_value() || name->empty()) {
        TENSORIZER_TORCH_THROW(MissingTypeTagError, "cannot decode an empty torch dtype");
    }

    const auto& full_name = name.value();
    auto separator = full_name.find('.');
    if (separator == std::string::npos
        || full_name.compare(0, separator, "torch") != 0
        || separator + 1 == full_name.size()) {
        TENSORIZER_TORCH_THROW(InvalidDtypeNameError,
            "invalid torch_dtype: '" + full_name + "', expected 'torch.<dtype>'"
        );
    }

    auto attribute = full_name.substr(separator + 1);
    for (const auto& dtype: TORCH_DTYPES) {
        if (attribute == dtype.name) {
            return dtype.dtype;
        }
    }

    for (const auto* other: TORCH_OTHER_ATTRIBUTES) {
        if (attribute == other) {
            TENSORIZER_TORCH_THROW(InvalidDtypeNameError,
                "invalid torch_dtype: '" + full_name + "' does not refer to a dtype"
            );
        }
    }

    TENSORIZER_TORCH_THROW(InvalidDtypeNameError,
        "invalid torch_dtype: '" + full_name + "' was not found in the torch module"
    );
}
