#pragma once

#include "../common/dispatcher.hpp"
#include "../tensor.hpp"

namespace fp8core::op {

// x_q = saturate(x / scale) with a single precomputed scale of shape [1].
class StaticScaledFp8Quant {
public:
    using schema = void (*)(Tensor, Tensor, Tensor);
    static void execute(Tensor x_q, Tensor x, Tensor scale);
    static common::OpDispatcher<schema> &dispatcher();
};

void static_scaled_fp8_quant_(Tensor x_q, Tensor x, Tensor scale);

// Dynamic quantization of a [M, K] activation in groups of `group_size`
// consecutive columns per row. x_scale is F32 [M, ceil(K / group_size)];
// group_size == K gives per-token scales.
class PerTokenGroupQuantFp8 {
public:
    using schema = void (*)(Tensor, Tensor, Tensor, Size);
    static void execute(Tensor x_q, Tensor x_scale, Tensor x, Size group_size);
    static common::OpDispatcher<schema> &dispatcher();
};

void per_token_group_quant_fp8_(Tensor x_q, Tensor x_scale, Tensor x, Size group_size);

} // namespace fp8core::op
