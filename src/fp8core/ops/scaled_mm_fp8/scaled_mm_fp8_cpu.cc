#include "../cpu_common.hpp"
#include "fp8core/ops/scaled_mm_fp8.hpp"

namespace fp8core::op::scaled_mm_fp8_impl::cpu {

void calculate(Tensor c, Tensor a, Tensor a_scale, Tensor b, Tensor b_scale) {
    const char *kernel = "scaled_mm_fp8";
    FP8CORE_KERNEL_CHECK(a->dtype() == DataType::F8 && b->dtype() == DataType::F8, kernel, "operands must be F8");
    FP8CORE_KERNEL_CHECK(op::cpu::isRowMajor2D(a), kernel, "a must be row-major, got " + a->info());
    FP8CORE_KERNEL_CHECK(op::cpu::isColMajor2D(b), kernel, "b must be column-major, got " + b->info());

    const Size m = a->size(0);
    const Size k = a->size(1);
    const Size n = b->size(1);
    FP8CORE_KERNEL_CHECK(b->size(0) == k, kernel, "inner dimensions differ");
    FP8CORE_KERNEL_CHECK(c->ndim() == 2 && c->size(0) == m && c->size(1) == n, kernel, "output shape mismatch");
    FP8CORE_KERNEL_CHECK(a_scale->is_contiguous() && (a_scale->numel() == 1 || a_scale->numel() == m),
                         kernel, "a_scale must be contiguous with 1 or M values");
    FP8CORE_KERNEL_CHECK(b_scale->is_contiguous() && (b_scale->numel() == 1 || b_scale->numel() == n),
                         kernel, "b_scale must be contiguous with 1 or N values");

    const std::vector<float> a_f = op::cpu::decode2D(a);
    const std::vector<float> b_f = op::cpu::decode2D(b);
    std::byte *c_base = c->data();

    for (Size row = 0; row < m; ++row) {
        const float sa = op::cpu::scaleAt(a_scale, row);
        for (Size col = 0; col < n; ++col) {
            float acc = 0.0f;
            for (Size i = 0; i < k; ++i) {
                acc += a_f[row * k + i] * b_f[i * n + col];
            }
            const float value = acc * sa * op::cpu::scaleAt(b_scale, col);
            op::cpu::store(c_base, c->dtype(), static_cast<Stride>(row) * c->stride(0) + static_cast<Stride>(col) * c->stride(1), value);
        }
    }
}

static bool registered = []() {
    ScaledMMFp8::dispatcher().registerDevice(Device::Type::CPU, &calculate);
    return true;
}();

} // namespace fp8core::op::scaled_mm_fp8_impl::cpu
