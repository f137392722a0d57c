#include <torch/torch.h>

#include <numeric>

#include "tensorizer/torch.hpp"
using namespace tensorizer_torch;

#include <catch2/catch.hpp>
using namespace Catch::Matchers;

static std::string native(const std::string& descr) {
    return std::string(1, NpyDtype::native_byteorder()) + descr;
}

static char non_native_byteorder() {
    return NpyDtype::native_byteorder() == '<' ? '>' : '<';
}


TEST_CASE("NpyDtype") {
    SECTION("parse") {
        auto dtype = NpyDtype::parse(native("f4"));
        CHECK(dtype.byteorder == NpyDtype::native_byteorder());
        CHECK(dtype.kind == 'f');
        CHECK(dtype.itemsize == 4);
        CHECK(dtype.str() == native("f4"));
        CHECK(dtype.name() == "float32");
        CHECK(dtype.is_native());

        dtype = NpyDtype::parse(">c16");
        CHECK(dtype.byteorder == '>');
        CHECK(dtype.itemsize == 16);
        CHECK(dtype.name() == "complex128");

        // missing or native byte order
        CHECK(NpyDtype::parse("=i8").str() == native("i8"));
        CHECK(NpyDtype::parse("u2").str() == native("u2"));
        CHECK(NpyDtype::parse("|f8").str() == native("f8"));

        // single byte, void and bytes types do not have a byte order
        CHECK(NpyDtype::parse("<i1").str() == "|i1");
        CHECK(NpyDtype::parse("<b1").str() == "|b1");
        CHECK(NpyDtype::parse("<V2").str() == "|V2");
        CHECK(NpyDtype::parse(">S3").str() == "|S3");

        CHECK(NpyDtype::parse("|b1").name() == "bool");
        CHECK(NpyDtype::parse("|u1").name() == "uint8");
        CHECK(NpyDtype::parse("<V2").name() == "void16");
        CHECK(NpyDtype::parse("|S4").name() == "bytes32");

        // unicode strings count characters
        dtype = NpyDtype::parse("<U4");
        CHECK(dtype.itemsize == 16);
        CHECK(dtype.str() == "<U4");
        CHECK(dtype.name() == "str128");
    }

    SECTION("invalid type strings") {
        auto invalid = std::vector<std::string>{
            "", "<", "f", "<f", "<i3", "<f1", "<c4", "|b2", "<x4", "<V0", "<i2x", "float32",
        };
        for (const auto& descr: invalid) {
            CHECK_THROWS_WITH(NpyDtype::parse(descr),
                StartsWith("data type '" + descr + "' not understood")
            );
        }
        CHECK_THROWS_AS(NpyDtype::parse("<i3"), c10::TypeError);
    }
}

TEST_CASE("NpyArray") {
    auto float64 = NpyDtype::parse(native("f8"));

    SECTION("empty arrays") {
        auto array = NpyArray::empty(float64, {2, 3});
        CHECK(array.ndim() == 2);
        CHECK(array.numel() == 6);
        CHECK(array.nbytes() == 48);
        CHECK(array.shape() == std::vector<int64_t>{2, 3});
        CHECK(array.strides() == std::vector<int64_t>{24, 8});
        CHECK(array.is_c_contiguous());
        CHECK(array.data() != nullptr);
        CHECK(array.base() != nullptr);

        // 0-dimensional arrays contain a single element
        array = NpyArray::empty(float64, {});
        CHECK(array.ndim() == 0);
        CHECK(array.numel() == 1);
        CHECK(array.nbytes() == 8);
        CHECK(array.data() != nullptr);

        array = NpyArray::empty(float64, {0, 3});
        CHECK(array.numel() == 0);
        CHECK(array.strides() == std::vector<int64_t>{24, 8});
        CHECK(array.is_c_contiguous());

        CHECK_THROWS_WITH(NpyArray::empty(float64, {2, -1}),
            StartsWith("negative dimensions are not allowed")
        );

        // the size in bytes must fit in an int64_t
        CHECK_THROWS_WITH(NpyArray::empty(float64, {int64_t(1) << 61}),
            StartsWith("array is too big")
        );
        CHECK_THROWS_AS(NpyArray::empty(float64, {0, int64_t(1) << 40, int64_t(1) << 40}), c10::ValueError);
    }

    SECTION("arrays over a buffer") {
        auto buffer = std::vector<uint8_t>(32);
        std::iota(buffer.begin(), buffer.end(), 0);

        auto int16 = NpyDtype::parse(native("i2"));
        auto array = NpyArray::from_buffer(int16, {2, 4}, buffer.data(), buffer.size(), 8);
        CHECK(array.data() == buffer.data() + 8);
        CHECK(array.base() == nullptr);
        CHECK(array.strides() == std::vector<int64_t>{8, 2});
        CHECK(static_cast<int16_t*>(array.data())[0] == *reinterpret_cast<int16_t*>(buffer.data() + 8));

        // the whole buffer
        array = NpyArray::from_buffer(int16, {16}, buffer.data(), buffer.size());
        CHECK(array.nbytes() == buffer.size());

        CHECK_THROWS_AS(
            NpyArray::from_buffer(int16, {16}, buffer.data(), buffer.size(), 2),
            c10::TypeError
        );
        CHECK_THROWS_WITH(
            NpyArray::from_buffer(float64, {8}, buffer.data(), buffer.size(), 4),
            StartsWith("buffer is too small for requested array")
        );
        CHECK_THROWS_WITH(
            NpyArray::from_buffer(float64, {0}, buffer.data(), buffer.size(), 33),
            StartsWith("offset must be non-negative and no greater than buffer length (32)")
        );
        CHECK_THROWS_AS(NpyArray(float64, {2, 2}, {8}, buffer.data(), nullptr), c10::ValueError);

        // the number of bytes wraps around to 0 without overflow checks
        CHECK_THROWS_AS(
            NpyArray::from_buffer(float64, {int64_t(1) << 61}, buffer.data(), 0),
            c10::ValueError
        );
        CHECK_THROWS_WITH(
            NpyArray::from_buffer(float64, {int64_t(1) << 32, int64_t(1) << 32}, buffer.data(), buffer.size()),
            StartsWith("array is too big")
        );
    }

    SECTION("non-contiguous arrays") {
        float values[6] = {0, 1, 2, 3, 4, 5};
        // transposed view of a 2x3 array
        auto array = NpyArray(NpyDtype::parse(native("f4")), {3, 2}, {4, 12}, values, nullptr);
        CHECK_FALSE(array.is_c_contiguous());

        auto tensor = array_to_tensor(array);
        CHECK(tensor.strides() == std::vector<int64_t>{1, 3});
        CHECK(torch::equal(tensor, torch::arange(6, torch::kFloat32).reshape({2, 3}).t()));

        // dimensions of size 1 do not affect contiguity
        array = NpyArray(NpyDtype::parse(native("f4")), {1, 6}, {128, 4}, values, nullptr);
        CHECK(array.is_c_contiguous());
    }
}

TEST_CASE("Native dtype mapping") {
    CHECK(array_dtype_for(torch::kFloat32).value().str() == native("f4"));
    CHECK(array_dtype_for(torch::kFloat16).value().str() == native("f2"));
    CHECK(array_dtype_for(torch::kInt64).value().str() == native("i8"));
    CHECK(array_dtype_for(torch::kInt8).value().str() == "|i1");
    CHECK(array_dtype_for(torch::kUInt8).value().str() == "|u1");
    CHECK(array_dtype_for(torch::kBool).value().str() == "|b1");
    CHECK(array_dtype_for(c10::ScalarType::ComplexDouble).value().str() == native("c16"));

    CHECK_FALSE(array_dtype_for(torch::kBFloat16).has_value());
    CHECK_FALSE(array_dtype_for(c10::ScalarType::ComplexHalf).has_value());
    CHECK_FALSE(array_dtype_for(c10::ScalarType::QInt8).has_value());
    CHECK_FALSE(array_dtype_for(c10::ScalarType::Float8_e5m2).has_value());

    CHECK(torch_dtype_for(NpyDtype::parse(native("f8"))).value() == torch::kFloat64);
    CHECK(torch_dtype_for(NpyDtype::parse("|u1")).value() == torch::kUInt8);
    CHECK(torch_dtype_for(NpyDtype::parse(native("u2"))).value() == c10::ScalarType::UInt16);
    CHECK(torch_dtype_for(NpyDtype::parse(native("c8"))).value() == c10::ScalarType::ComplexFloat);
    CHECK_FALSE(torch_dtype_for(NpyDtype::parse("|V2")).has_value());
    CHECK_FALSE(torch_dtype_for(NpyDtype::parse("|S8")).has_value());
    CHECK_FALSE(torch_dtype_for(NpyDtype::parse(native("U1"))).has_value());
}

TEST_CASE("Tensor to array") {
    auto tensor = torch::arange(6, torch::kFloat32).reshape({2, 3});
    auto array = tensor_to_array(tensor);
    CHECK(array.dtype().str() == native("f4"));
    CHECK(array.shape() == std::vector<int64_t>{2, 3});
    CHECK(array.strides() == std::vector<int64_t>{12, 4});
    CHECK(array.data() == tensor.data_ptr());
    CHECK(array.base() != nullptr);

    auto transposed = tensor_to_array(tensor.t());
    CHECK(transposed.shape() == std::vector<int64_t>{3, 2});
    CHECK(transposed.strides() == std::vector<int64_t>{4, 12});
    CHECK_FALSE(transposed.is_c_contiguous());

    // views with a storage offset point inside the tensor's memory
    auto row = tensor_to_array(tensor[1]);
    CHECK(row.data() == static_cast<float*>(tensor.data_ptr()) + 3);

    CHECK_THROWS_AS(tensor_to_array(tensor.to(torch::kBFloat16)), c10::TypeError);
    CHECK_THROWS_WITH(tensor_to_array(tensor.to(torch::kBFloat16)),
        StartsWith("got unsupported ScalarType BFloat16")
    );

    auto requires_grad = torch::ones({3}, torch::requires_grad());
    CHECK_THROWS_WITH(tensor_to_array(requires_grad),
        StartsWith("can't call numpy() on a tensor that requires grad")
    );

    // lazy conjugation and negation are not visible in the raw data
    auto complex = torch::arange(4, torch::kFloat32).view(c10::ScalarType::ComplexFloat);
    CHECK_THROWS_WITH(tensor_to_array(complex.conj()),
        StartsWith("can't call numpy() on a tensor that has conjugate bit set")
    );
    CHECK_THROWS_WITH(tensor_to_array(at::_neg_view(tensor)),
        StartsWith("can't call numpy() on a tensor that has negative bit set")
    );
    CHECK(tensor_to_array(complex.conj().resolve_conj()).numel() == 2);
}

TEST_CASE("Array to tensor") {
    SECTION("shared memory") {
        auto buffer = std::vector<int32_t>{0, 1, 2, 3, 4, 5};
        auto array = NpyArray::from_buffer(
            NpyDtype::parse(native("i4")), {3, 2},
            buffer.data(), buffer.size() * sizeof(int32_t)
        );

        auto tensor = array_to_tensor(array);
        CHECK(tensor.scalar_type() == torch::kInt32);
        CHECK(tensor.sizes() == std::vector<int64_t>{3, 2});
        CHECK(tensor.data_ptr() == buffer.data());
        CHECK(torch::equal(tensor, torch::arange(6, torch::kInt32).reshape({3, 2})));

        buffer[0] = 42;
        CHECK(tensor[0][0].item<int32_t>() == 42);
    }

    SECTION("keeps the base alive") {
        auto tensor = torch::Tensor();
        {
            auto array = NpyArray::empty(NpyDtype::parse(native("i8")), {4});
            auto* values = static_cast<int64_t*>(array.data());
            for (int64_t i = 0; i < 4; i++) {
                values[i] = i;
            }
            tensor = array_to_tensor(array);
        }
        CHECK(torch::equal(tensor, torch::arange(4, torch::kInt64)));
    }

    SECTION("round trip with tensors") {
        auto tensor = torch::arange(12, torch::kFloat64).reshape({3, 4}).t();
        auto back = array_to_tensor(tensor_to_array(tensor));
        CHECK(back.data_ptr() == tensor.data_ptr());
        CHECK(back.strides() == tensor.strides());
        CHECK(torch::equal(back, tensor));
    }

    SECTION("errors") {
        auto buffer = std::vector<uint8_t>(16);

        auto void16 = NpyArray::from_buffer(NpyDtype::parse("|V2"), {8}, buffer.data(), buffer.size());
        CHECK_THROWS_AS(array_to_tensor(void16), c10::TypeError);
        CHECK_THROWS_WITH(array_to_tensor(void16),
            StartsWith("can't convert np.ndarray of type numpy.void16")
        );

        auto swapped = NpyDtype{non_native_byteorder(), 'f', 4};
        auto array = NpyArray::from_buffer(swapped, {4}, buffer.data(), buffer.size());
        CHECK_THROWS_AS(array_to_tensor(array), c10::ValueError);
        CHECK_THROWS_WITH(array_to_tensor(array),
            StartsWith("given numpy array has byte order different from the native byte order")
        );

        auto int16 = NpyDtype::parse(native("i2"));
        auto negative = NpyArray(int16, {2}, {-2}, buffer.data() + 2, nullptr);
        CHECK_THROWS_WITH(array_to_tensor(negative),
            StartsWith("at least one stride in the given numpy array is negative")
        );

        auto misaligned = NpyArray(int16, {2}, {3}, buffer.data(), nullptr);
        CHECK_THROWS_WITH(array_to_tensor(misaligned),
            StartsWith("given numpy array strides not a multiple of the element byte size")
        );
    }
}
