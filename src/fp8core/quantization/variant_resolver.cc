#include "fp8core/quantization/variant_resolver.hpp"

#include <spdlog/spdlog.h>

namespace fp8core::quantization {

QuantVariant VariantResolver::resolve(const nn::LayerConfig &config) {
    if (config.use_marlin) {
        return PackedVariant{};
    }
    if (config.weight_block_size.has_value()) {
        const auto &block = *config.weight_block_size;
        if (block[0] > 0 && block[1] > 0) {
            return BlockVariant{block[0], block[1]};
        }
        SPDLOG_WARN("Layer '{}': ignoring weight_block_size [{}, {}], falling back to per-tensor scales",
                    config.prefix, block[0], block[1]);
        return StandardVariant{Granularity::TENSOR};
    }
    return StandardVariant{config.per_channel_supported ? Granularity::CHANNEL : Granularity::TENSOR};
}

} // namespace fp8core::quantization
