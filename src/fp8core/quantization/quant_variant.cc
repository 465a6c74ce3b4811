#include "fp8core/quantization/quant_variant.hpp"

namespace fp8core::quantization {

std::string toString(Granularity granularity) {
    switch (granularity) {
    case Granularity::CHANNEL:
        return "channel";
    case Granularity::TENSOR:
        return "tensor";
    }
    return "unknown";
}

std::string toString(const QuantVariant &variant) {
    struct Printer {
        std::string operator()(const StandardVariant &v) const {
            return "Standard(" + toString(v.granularity) + ")";
        }
        std::string operator()(const BlockVariant &v) const {
            return "Block(" + std::to_string(v.block_n) + "x" + std::to_string(v.block_k) + ")";
        }
        std::string operator()(const PackedVariant &) const {
            return "Packed";
        }
    };
    return std::visit(Printer{}, variant);
}

} // namespace fp8core::quantization
