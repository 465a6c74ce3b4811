#pragma once

#include <cstddef>
#include <string>
#include <variant>

namespace fp8core::quantization {

enum class Granularity {
    CHANNEL,
    TENSOR,
};

// One scale per tensor or per output channel.
struct StandardVariant {
    Granularity granularity = Granularity::TENSOR;
};

// One scale per [block_n, block_k] tile of the weight.
struct BlockVariant {
    size_t block_n = 0;
    size_t block_k = 0;
};

// Weight-only path through the Marlin-style packed kernel.
struct PackedVariant {};

using QuantVariant = std::variant<StandardVariant, BlockVariant, PackedVariant>;

inline bool operator==(const StandardVariant &a, const StandardVariant &b) { return a.granularity == b.granularity; }
inline bool operator==(const BlockVariant &a, const BlockVariant &b) {
    return a.block_n == b.block_n && a.block_k == b.block_k;
}
inline bool operator==(const PackedVariant &, const PackedVariant &) { return true; }

inline bool operator!=(const StandardVariant &a, const StandardVariant &b) { return !(a == b); }
inline bool operator!=(const BlockVariant &a, const BlockVariant &b) { return !(a == b); }
inline bool operator!=(const PackedVariant &a, const PackedVariant &b) { return !(a == b); }

std::string toString(Granularity granularity);
std::string toString(const QuantVariant &variant);

} // namespace fp8core::quantization
