#pragma once

#include "../common/dispatcher.hpp"
#include "../tensor.hpp"

namespace fp8core::op {

// Block-wise scaled GEMM.
//   a: F8 [M, K] row-major, a_scale: F32 [M, ceil(K / block_k)]
//   b: F8 [K, N] column-major, b_scale: [ceil(N / block_n), ceil(K / block_k)]
class BlockScaledMMFp8 {
public:
    using schema = void (*)(Tensor, Tensor, Tensor, Tensor, Tensor, Size, Size);
    static void execute(Tensor c, Tensor a, Tensor a_scale, Tensor b, Tensor b_scale,
                        Size block_n, Size block_k);
    static common::OpDispatcher<schema> &dispatcher();
};

void block_scaled_mm_fp8_(Tensor c, Tensor a, Tensor a_scale, Tensor b, Tensor b_scale,
                          Size block_n, Size block_k);

} // namespace fp8core::op
