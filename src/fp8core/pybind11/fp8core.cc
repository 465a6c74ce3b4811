#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <fp8core.hpp>

#include <cstring>
#include <stdexcept>

namespace py = pybind11;

namespace fp8core {

namespace {

// Host tensor holding a copy of a C-contiguous numpy array. F8 parameters are
// passed as uint8 arrays of raw E4M3FN bits.
Tensor tensorFromArray(const py::array &array, DataType dtype) {
    if (static_cast<size_t>(array.itemsize()) != dsize(dtype)) {
        throw std::runtime_error("numpy itemsize " + std::to_string(array.itemsize()) + " does not match "
                                 + toString(dtype));
    }
    if (!(array.flags() & py::array::c_style)) {
        throw std::runtime_error("numpy array must be C-contiguous");
    }
    Shape shape(array.shape(), array.shape() + array.ndim());
    auto tensor = Tensor::empty(shape, dtype, Device());
    std::memcpy(tensor->data(), array.data(), tensor->nbytes());
    return tensor;
}

py::array_t<float> arrayFromTensor(const Tensor &tensor) {
    Tensor host = tensor->to(Device())->contiguous();
    py::array_t<float> result(std::vector<py::ssize_t>(host->shape().begin(), host->shape().end()));
    auto *dst = result.mutable_data();
    for (Size i = 0; i < host->numel(); ++i) {
        dst[i] = readFloat(host->data() + i * host->element_size(), host->dtype());
    }
    return result;
}

} // namespace

PYBIND11_MODULE(_fp8core, m) {
    py::enum_<DataType>(m, "dtype")
        .value("float8_e4m3fn", DataType::F8)
        .value("float16", DataType::F16)
        .value("bfloat16", DataType::BF16)
        .value("float32", DataType::F32)
        .value("float64", DataType::F64)
        .export_values();

    py::enum_<Device::Type>(m, "DeviceType")
        .value("CPU", Device::Type::CPU)
        .value("CUDA", Device::Type::CUDA);

    py::class_<Device>(m, "Device")
        .def(py::init<const Device::Type &, const Device::Index &>(),
             py::arg("type") = Device::Type::CPU, py::arg("index") = 0)
        .def_property_readonly("type", &Device::getType)
        .def_property_readonly("index", &Device::getIndex)
        .def("__repr__", static_cast<std::string (Device::*)() const>(&Device::toString));

    py::class_<nn::LayerConfig>(m, "LayerConfig")
        .def(py::init<>())
        .def_readwrite("in_features", &nn::LayerConfig::in_features)
        .def_readwrite("out_features", &nn::LayerConfig::out_features)
        .def_readwrite("per_channel_supported", &nn::LayerConfig::per_channel_supported)
        .def_readwrite("weight_block_size", &nn::LayerConfig::weight_block_size)
        .def_readwrite("use_marlin", &nn::LayerConfig::use_marlin)
        .def_readwrite("static_activation", &nn::LayerConfig::static_activation)
        .def_readwrite("bias", &nn::LayerConfig::bias)
        .def_readwrite("params_dtype", &nn::LayerConfig::params_dtype)
        .def_readwrite("prefix", &nn::LayerConfig::prefix);

    py::class_<nn::Fp8Linear>(m, "Fp8Linear")
        .def(py::init<nn::LayerConfig, const Device &>(), py::arg("config"), py::arg("device") = Device())
        .def(
            "load_parameter", [](nn::Fp8Linear &self, const std::string &name, const py::array &array, DataType dtype) {
                self.load_parameter(name, tensorFromArray(array, dtype));
            },
            py::arg("name"), py::arg("array"), py::arg("dtype"))
        .def("process_weights_after_loading", &nn::Fp8Linear::process_weights_after_loading)
        .def(
            "forward", [](nn::Fp8Linear &self, py::array_t<float, py::array::c_style | py::array::forcecast> input) {
                Tensor x = tensorFromArray(input, DataType::F32)->to(self.device());
                return arrayFromTensor(self.forward(x));
            },
            py::arg("input"))
        .def("variant", [](const nn::Fp8Linear &self) { return quantization::toString(self.variant()); })
        .def_property_readonly("placeholder_count", &nn::Fp8Linear::placeholder_count)
        .def_property_readonly("materialized", &nn::Fp8Linear::is_materialized)
        .def("extra_repr", &nn::Fp8Linear::extra_repr);

    py::register_exception<ShapeMismatch>(m, "ShapeMismatch");
    py::register_exception<UnsupportedVariant>(m, "UnsupportedVariant");
    py::register_exception<KernelFailure>(m, "KernelFailure");
}

} // namespace fp8core
