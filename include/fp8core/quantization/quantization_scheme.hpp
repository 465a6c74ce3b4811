#pragma once

namespace fp8core::quantization {

enum class QuantScheme {
    FP8_W8A8,
    FP8_BLOCK_W8A8,
};

} // namespace fp8core::quantization
