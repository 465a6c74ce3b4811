#include "../cpu_common.hpp"
#include "fp8core/ops/block_scaled_mm_fp8.hpp"

#include <algorithm>

namespace fp8core::op::block_scaled_mm_fp8_impl::cpu {

void calculate(Tensor c, Tensor a, Tensor a_scale, Tensor b, Tensor b_scale, Size block_n, Size block_k) {
    const char *kernel = "block_scaled_mm_fp8";
    FP8CORE_KERNEL_CHECK(a->dtype() == DataType::F8 && b->dtype() == DataType::F8, kernel, "operands must be F8");
    FP8CORE_KERNEL_CHECK(op::cpu::isRowMajor2D(a), kernel, "a must be row-major, got " + a->info());
    FP8CORE_KERNEL_CHECK(op::cpu::isColMajor2D(b), kernel, "b must be column-major, got " + b->info());

    const Size m = a->size(0);
    const Size k = a->size(1);
    const Size n = b->size(1);
    const Size k_blocks = (k + block_k - 1) / block_k;
    const Size n_blocks = (n + block_n - 1) / block_n;
    FP8CORE_KERNEL_CHECK(b->size(0) == k, kernel, "inner dimensions differ");
    FP8CORE_KERNEL_CHECK(c->ndim() == 2 && c->size(0) == m && c->size(1) == n, kernel, "output shape mismatch");
    FP8CORE_KERNEL_CHECK(a_scale->is_contiguous() && a_scale->shape() == Shape({m, k_blocks}),
                         kernel, "a_scale must be contiguous [M, ceil(K / block_k)], got " + a_scale->info());
    FP8CORE_KERNEL_CHECK(b_scale->is_contiguous() && b_scale->shape() == Shape({n_blocks, k_blocks}),
                         kernel, "b_scale must be contiguous [ceil(N / block_n), ceil(K / block_k)], got " + b_scale->info());

    const std::vector<float> a_f = op::cpu::decode2D(a);
    const std::vector<float> b_f = op::cpu::decode2D(b);
    const std::vector<float> a_s = op::cpu::decode2D(a_scale);
    const std::vector<float> b_s = op::cpu::decode2D(b_scale);
    std::byte *c_base = c->data();

    for (Size row = 0; row < m; ++row) {
        for (Size col = 0; col < n; ++col) {
            const Size nb = col / block_n;
            float acc = 0.0f;
            for (Size kb = 0; kb < k_blocks; ++kb) {
                const Size begin = kb * block_k;
                const Size end = std::min(k, begin + block_k);
                float partial = 0.0f;
                for (Size i = begin; i < end; ++i) {
                    partial += a_f[row * k + i] * b_f[i * n + col];
                }
                acc += partial * a_s[row * k_blocks + kb] * b_s[nb * k_blocks + kb];
            }
            op::cpu::store(c_base, c->dtype(), static_cast<Stride>(row) * c->stride(0) + static_cast<Stride>(col) * c->stride(1), acc);
        }
    }
}

static bool registered = []() {
    BlockScaledMMFp8::dispatcher().registerDevice(Device::Type::CPU, &calculate);
    return true;
}();

} // namespace fp8core::op::block_scaled_mm_fp8_impl::cpu
