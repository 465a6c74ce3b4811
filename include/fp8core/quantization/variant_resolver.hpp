#pragma once

#include "../nn/layer_config.hpp"
#include "quant_variant.hpp"

namespace fp8core::quantization {

class VariantResolver {
public:
    // Total and deterministic. First match wins: use_marlin -> Packed, a block
    // size with both dims > 0 -> Block, otherwise Standard (CHANNEL when the
    // device has a per-channel path).
    static QuantVariant resolve(const nn::LayerConfig &config);
};

} // namespace fp8core::quantization
