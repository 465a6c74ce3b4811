#pragma once

#include "../common/dispatcher.hpp"
#include "../tensor.hpp"

namespace fp8core::op {

// c[M, N] = (a[M, K] * a_scale) @ (b[K, N] * b_scale)
//   a: F8, row-major (stride 1 on the last axis)
//   b: F8, column-major (stride 1 on the first axis)
//   a_scale: F32 [1] (per tensor) or [M, 1] (per token)
//   b_scale: [1] (per tensor) or [N] (per channel)
class ScaledMMFp8 {
public:
    using schema = void (*)(Tensor, Tensor, Tensor, Tensor, Tensor);
    static void execute(Tensor c, Tensor a, Tensor a_scale, Tensor b, Tensor b_scale);
    static common::OpDispatcher<schema> &dispatcher();
};

void scaled_mm_fp8_(Tensor c, Tensor a, Tensor a_scale, Tensor b, Tensor b_scale);

} // namespace fp8core::op
