#include <torch/script.h>

#include "tensorizer/torch/dtype.hpp"
#include "tensorizer/torch/misc.hpp"
#include "tensorizer/torch/numpy_tensor.hpp"

using namespace tensorizer_torch;

static NumpyTensor numpy_tensor_from_buffer(
    const std::string& numpy_dtype,
    torch::optional<std::string> torch_dtype,
    std::vector<int64_t> shape,
    const torch::Tensor& buffer,
    int64_t offset
) {
    if (offset < 0) {
        C10_THROW_ERROR(ValueError,
            "offset must be non-negative, got " + std::to_string(offset)
        );
    }

    return NumpyTensorHolder::from_buffer(
        numpy_dtype,
        std::move(torch_dtype),
        std::move(shape),
        buffer,
        static_cast<size_t>(offset)
    );
}

TORCH_LIBRARY(tensorizer, m) {
    m.class_<NumpyTensorHolder>("NumpyTensor")
        .def_property("numpy_dtype", &NumpyTensorHolder::numpy_dtype)
        .def_property("torch_dtype", &NumpyTensorHolder::torch_dtype)
        .def_property("is_opaque", &NumpyTensorHolder::is_opaque)
        .def("to_tensor", &NumpyTensorHolder::to_tensor)
        .def("__repr__", &NumpyTensorHolder::repr)
        .def("__str__", &NumpyTensorHolder::repr);

    // standalone functions
    m.def("version() -> str", version);

    m.def("is_opaque(str numpy_dtype) -> bool", tensorizer_torch::is_opaque);
    m.def("decoder_dtype(str numpy_dtype) -> str", decoder_dtype);

    m.def(
        "numpy_tensor_from_tensor(Tensor tensor) -> __torch__.torch.classes.tensorizer.NumpyTensor",
        [](torch::Tensor tensor) -> NumpyTensor {
            return NumpyTensorHolder::from_tensor(std::move(tensor));
        }
    );

    // `str? torch_dtype` makes TorchScript reject anything else than a string
    // or None for the torch dtype, before it reaches the C++ code
    m.def(
        "numpy_tensor_from_buffer("
            "str numpy_dtype, "
            "str? torch_dtype, "
            "int[] shape, "
            "Tensor buffer, "
            "int offset = 0"
        ") -> __torch__.torch.classes.tensorizer.NumpyTensor",
        numpy_tensor_from_buffer
    );
}
