#pragma once

#include "../common/dispatcher.hpp"
#include "../tensor.hpp"

namespace fp8core::op {

// Packed weight format: the [N, K] weight is cut into tiles of
// MARLIN_TILE x MARLIN_TILE. Row `kt` of the packed tensor holds, for every
// column tile nt, the tile bytes ordered (n_in, k_in). Four FP8 values share
// one I32 word, so the packed shape is [K / MARLIN_TILE, N * MARLIN_TILE / 4].
constexpr Size MARLIN_TILE = 16;

Shape marlin_packed_shape(Size size_n, Size size_k);

class MarlinRepackFp8 {
public:
    using schema = void (*)(Tensor, Tensor);
    static void execute(Tensor packed, Tensor weight);
    static common::OpDispatcher<schema> &dispatcher();
};

// Repacks an F8 [N, K] weight. N and K must be multiples of MARLIN_TILE.
Tensor marlin_repack_fp8(Tensor weight);
void marlin_repack_fp8_(Tensor packed, Tensor weight);

// Weight-only FP8 GEMM: c[M, N] = a[M, K] @ dequant(b_packed, b_scale[N])^T.
// a stays in its floating dtype and must be row-major.
class MarlinGemmFp8 {
public:
    using schema = void (*)(Tensor, Tensor, Tensor, Tensor, Size, Size);
    static void execute(Tensor c, Tensor a, Tensor b_packed, Tensor b_scale, Size size_n, Size size_k);
    static common::OpDispatcher<schema> &dispatcher();
};

void marlin_gemm_fp8_(Tensor c, Tensor a, Tensor b_packed, Tensor b_scale, Size size_n, Size size_k);

} // namespace fp8core::op
