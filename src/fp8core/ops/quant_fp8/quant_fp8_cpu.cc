#include "../../../utils/custom_types.h"
#include "../cpu_common.hpp"
#include "fp8core/ops/quant_fp8.hpp"

#include <algorithm>
#include <cmath>

namespace fp8core::op::quant_fp8_impl::cpu {

namespace {
// Floor on the dynamic scale so an all-zero group does not divide by zero.
constexpr float kMinScale = 1e-10f;
} // namespace

void calculate_static(Tensor x_q, Tensor x, Tensor scale) {
    FP8CORE_KERNEL_CHECK(x_q->dtype() == DataType::F8, "static_scaled_fp8_quant", "output must be F8");
    FP8CORE_KERNEL_CHECK(scale->numel() == 1, "static_scaled_fp8_quant", "scale must hold a single value");
    const float s = op::cpu::load(scale->data(), scale->dtype(), 0);
    FP8CORE_KERNEL_CHECK(s > 0.0f && std::isfinite(s), "static_scaled_fp8_quant", "scale must be positive and finite");

    const float inv = 1.0f / s;
    std::byte *q_base = x_q->data();
    const std::byte *x_base = x->data();
    op::cpu::forEachIndex(x->shape(), [&](const std::vector<Size> &index) {
        float v = op::cpu::load(x_base, x->dtype(), op::cpu::offsetOf(index, x->strides()));
        op::cpu::store(q_base, DataType::F8, op::cpu::offsetOf(index, x_q->strides()), v * inv);
    });
}

void calculate_per_token_group(Tensor x_q, Tensor x_scale, Tensor x, Size group_size) {
    FP8CORE_KERNEL_CHECK(x_q->dtype() == DataType::F8, "per_token_group_quant_fp8", "output must be F8");
    const Size m = x->size(0);
    const Size k = x->size(1);
    const Size groups = (k + group_size - 1) / group_size;
    FP8CORE_KERNEL_CHECK(x_scale->ndim() == 2 && x_scale->size(0) == m && x_scale->size(1) == groups,
                         "per_token_group_quant_fp8",
                         "scale shape " + shapeToString(x_scale->shape()) + " does not match [" + std::to_string(m) + ", " + std::to_string(groups) + "]");

    const std::byte *x_base = x->data();
    std::byte *q_base = x_q->data();
    std::byte *s_base = x_scale->data();
    for (Size row = 0; row < m; ++row) {
        for (Size g = 0; g < groups; ++g) {
            const Size begin = g * group_size;
            const Size end = std::min(k, begin + group_size);
            float amax = 0.0f;
            for (Size col = begin; col < end; ++col) {
                float v = op::cpu::load(x_base, x->dtype(), static_cast<Stride>(row) * x->stride(0) + static_cast<Stride>(col) * x->stride(1));
                amax = std::max(amax, std::fabs(v));
            }
            const float scale = std::max(amax, kMinScale) / FP8_E4M3_MAX;
            op::cpu::store(s_base, x_scale->dtype(), static_cast<Stride>(row) * x_scale->stride(0) + static_cast<Stride>(g) * x_scale->stride(1), scale);
            for (Size col = begin; col < end; ++col) {
                float v = op::cpu::load(x_base, x->dtype(), static_cast<Stride>(row) * x->stride(0) + static_cast<Stride>(col) * x->stride(1));
                op::cpu::store(q_base, DataType::F8, static_cast<Stride>(row) * x_q->stride(0) + static_cast<Stride>(col) * x_q->stride(1), v / scale);
            }
        }
    }
}

static bool registered = []() {
    StaticScaledFp8Quant::dispatcher().registerDevice(Device::Type::CPU, &calculate_static);
    PerTokenGroupQuantFp8::dispatcher().registerDevice(Device::Type::CPU, &calculate_per_token_group);
    return true;
}();

} // namespace fp8core::op::quant_fp8_impl::cpu
