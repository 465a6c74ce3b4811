#pragma once

#include "fp8_linear.hpp"

namespace fp8core::nn {

class MatMulDispatcher {
public:
    // output[..., N] = activation[..., K] through the kernel of the layer's
    // variant, plus bias. Kernel errors propagate unchanged.
    static Tensor apply(Fp8Linear &layer, const Tensor &activation);

    // Throws UnsupportedVariant when a kernel the variant needs has no entry
    // point for the device type.
    static void check_kernels(const quantization::QuantVariant &variant, const Device &device);
};

} // namespace fp8core::nn
