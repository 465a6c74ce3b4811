#include "../cpu_common.hpp"
#include "fp8core/ops/marlin_fp8.hpp"
#include "../../../utils/custom_types.h"

#include <cstdint>
#include <cstring>

namespace fp8core::op::marlin_fp8_impl::cpu {

namespace {

// Byte position of weight[n, k] inside packed row k / MARLIN_TILE.
inline Size packedByte(Size n, Size k) {
    const Size nt = n / MARLIN_TILE;
    const Size n_in = n % MARLIN_TILE;
    const Size k_in = k % MARLIN_TILE;
    return nt * MARLIN_TILE * MARLIN_TILE + n_in * MARLIN_TILE + k_in;
}

} // namespace

void repack(Tensor packed, Tensor weight) {
    const char *kernel = "marlin_repack_fp8";
    FP8CORE_KERNEL_CHECK(weight->dtype() == DataType::F8 && weight->ndim() == 2, kernel, "weight must be a 2D F8 tensor");
    const Size n = weight->size(0);
    const Size k = weight->size(1);
    FP8CORE_KERNEL_CHECK(n % MARLIN_TILE == 0 && k % MARLIN_TILE == 0, kernel,
                         "weight " + shapeToString(weight->shape()) + " is not a multiple of the tile size");
    FP8CORE_KERNEL_CHECK(packed->dtype() == DataType::I32 && packed->is_contiguous()
                             && packed->shape() == marlin_packed_shape(n, k),
                         kernel, "packed tensor must be contiguous I32 " + shapeToString(marlin_packed_shape(n, k)));

    const Size row_bytes = n * MARLIN_TILE;
    auto *dst = reinterpret_cast<std::uint8_t *>(packed->data());
    const std::byte *src = weight->data();
    for (Size row = 0; row < n; ++row) {
        for (Size col = 0; col < k; ++col) {
            const Stride offset = static_cast<Stride>(row) * weight->stride(0) + static_cast<Stride>(col) * weight->stride(1);
            std::uint8_t bits;
            std::memcpy(&bits, src + offset, 1);
            dst[(col / MARLIN_TILE) * row_bytes + packedByte(row, col)] = bits;
        }
    }
}

void gemm(Tensor c, Tensor a, Tensor b_packed, Tensor b_scale, Size size_n, Size size_k) {
    const char *kernel = "marlin_gemm_fp8";
    FP8CORE_KERNEL_CHECK(isFloatingPoint(a->dtype()) && a->dtype() != DataType::F8, kernel, "a must be a wide floating tensor");
    FP8CORE_KERNEL_CHECK(op::cpu::isRowMajor2D(a) && a->size(1) == size_k, kernel, "a must be row-major [M, K], got " + a->info());
    FP8CORE_KERNEL_CHECK(b_packed->dtype() == DataType::I32 && b_packed->is_contiguous()
                             && b_packed->shape() == marlin_packed_shape(size_n, size_k),
                         kernel, "b_packed does not match [N, K] = " + shapeToString({size_n, size_k}));
    FP8CORE_KERNEL_CHECK(b_scale->is_contiguous() && b_scale->numel() == size_n, kernel, "b_scale must be contiguous [N]");
    const Size m = a->size(0);
    FP8CORE_KERNEL_CHECK(c->ndim() == 2 && c->size(0) == m && c->size(1) == size_n, kernel, "output shape mismatch");

    const Size row_bytes = size_n * MARLIN_TILE;
    const auto *bits = reinterpret_cast<const std::uint8_t *>(b_packed->data());
    std::vector<float> w(size_n * size_k);
    for (Size row = 0; row < size_n; ++row) {
        const float scale = op::cpu::scaleAt(b_scale, row);
        for (Size col = 0; col < size_k; ++col) {
            fp8_e4m3_t v{bits[(col / MARLIN_TILE) * row_bytes + packedByte(row, col)]};
            w[row * size_k + col] = utils::cast<float>(v) * scale;
        }
    }

    const std::vector<float> a_f = op::cpu::decode2D(a);
    std::byte *c_base = c->data();
    for (Size i = 0; i < m; ++i) {
        for (Size j = 0; j < size_n; ++j) {
            float acc = 0.0f;
            for (Size p = 0; p < size_k; ++p) {
                acc += a_f[i * size_k + p] * w[j * size_k + p];
            }
            op::cpu::store(c_base, c->dtype(), static_cast<Stride>(i) * c->stride(0) + static_cast<Stride>(j) * c->stride(1), acc);
        }
    }
}

static bool registered = []() {
    MarlinRepackFp8::dispatcher().registerDevice(Device::Type::CPU, &repack);
    MarlinGemmFp8::dispatcher().registerDevice(Device::Type::CPU, &gemm);
    return true;
}();

} // namespace fp8core::op::marlin_fp8_impl::cpu
