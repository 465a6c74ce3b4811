#include "test_fp8_kernels.h"
#include "../utils/custom_types.h"
#include "fp8core/error.hpp"
#include "fp8core/ops.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace fp8core::test {

namespace {

uint8_t bitsOf(float value) {
    return _f32_to_f8e4m3(value)._v;
}

} // namespace

TestResult Fp8KernelTest::testE4M3Conversion() {
    return measureTime("E4M3Conversion", [this]() {
        struct Case {
            float value;
            uint8_t bits;
        };
        const Case cases[] = {
            {0.0f, 0x00},
            {1.0f, 0x38},
            {-2.0f, 0xC0},
            {448.0f, 0x7E},
            {1000.0f, 0x7E},  // saturates
            {-1000.0f, 0xFE}, // saturates
            {1.0625f, 0x38},  // tie, rounds to even mantissa
            {1.1875f, 0x3A},  // tie, rounds to even mantissa
            {0.001953125f, 0x01}, // 2^-9, smallest subnormal
            {0.015625f, 0x08},    // 2^-6, smallest normal
        };
        for (const auto &c : cases) {
            if (bitsOf(c.value) != c.bits) {
                SPDLOG_ERROR("{} encoded as 0x{:02X}, expected 0x{:02X}", c.value, bitsOf(c.value), c.bits);
                return false;
            }
        }
        if ((bitsOf(std::numeric_limits<float>::quiet_NaN()) & 0x7F) != 0x7F) {
            SPDLOG_ERROR("NaN must encode as 0x7F");
            return false;
        }
        if (!std::isnan(_f8e4m3_to_f32(fp8_e4m3_t{0x7F}))) {
            SPDLOG_ERROR("0x7F must decode to NaN");
            return false;
        }
        // Every finite code survives decode then encode.
        for (int code = 0; code < 256; ++code) {
            if ((code & 0x7F) == 0x7F) {
                continue;
            }
            float value = _f8e4m3_to_f32(fp8_e4m3_t{static_cast<uint8_t>(code)});
            uint8_t back = bitsOf(value);
            if (back != code && !(value == 0.0f && (back & 0x7F) == 0)) {
                SPDLOG_ERROR("Code 0x{:02X} ({}) re-encoded as 0x{:02X}", code, value, back);
                return false;
            }
        }

        SPDLOG_INFO("✓ E4M3 conversion passed");
        return true;
    });
}

TestResult Fp8KernelTest::testPerTokenGroupQuant() {
    return measureTime("PerTokenGroupQuant", [this]() {
        // Row 0 has amax 2 in group 0 and amax 0.5 in group 1; row 1 is all zero.
        auto x = makeTensor({2.0f, -1.0f, 0.5f, 0.25f, 0.0f, 0.0f, 0.0f, 0.0f}, {2, 4});
        auto x_q = Tensor::empty({2, 4}, DataType::F8, Device());
        auto x_scale = Tensor::empty({2, 2}, DataType::F32, Device());
        op::per_token_group_quant_fp8_(x_q, x_scale, x, 2);

        auto scales = toFloats(x_scale);
        if (!allClose({scales[0], scales[1]}, {2.0f / 448.0f, 0.5f / 448.0f}, 1e-6, 0.0)) {
            SPDLOG_ERROR("Group scales should be amax / 448");
            return false;
        }
        if (!allClose(toFloats(x_q), {448.0f, -224.0f, 448.0f, 224.0f, 0.0f, 0.0f, 0.0f, 0.0f}, 0.0, 0.0)) {
            SPDLOG_ERROR("Quantized values are wrong");
            return false;
        }

        auto bad_scale = Tensor::empty({2, 1}, DataType::F32, Device());
        try {
            op::per_token_group_quant_fp8_(x_q, bad_scale, x, 2);
            SPDLOG_ERROR("Expected KernelFailure for a wrong scale shape");
            return false;
        } catch (const KernelFailure &e) {
            SPDLOG_DEBUG("Got expected error: {}", e.what());
        }

        SPDLOG_INFO("✓ Per-token-group quant passed");
        return true;
    });
}

TestResult Fp8KernelTest::testStaticQuantRejectsBadScale() {
    return measureTime("StaticQuantRejectsBadScale", [this]() {
        auto x = makeTensor({1.0f, 2.0f}, {1, 2});
        auto x_q = Tensor::empty({1, 2}, DataType::F8, Device());
        for (float s : {0.0f, -1.0f}) {
            try {
                op::static_scaled_fp8_quant_(x_q, x, makeTensor({s}, {1}));
                SPDLOG_ERROR("Scale {} should be rejected", s);
                return false;
            } catch (const KernelFailure &e) {
                SPDLOG_DEBUG("Got expected error: {}", e.what());
            }
        }

        op::static_scaled_fp8_quant_(x_q, x, makeTensor({0.5f}, {1}));
        if (!allClose(toFloats(x_q), {2.0f, 4.0f}, 0.0, 0.0)) {
            SPDLOG_ERROR("Static quantization divides by the scale");
            return false;
        }

        SPDLOG_INFO("✓ Static quant passed");
        return true;
    });
}

TestResult Fp8KernelTest::testMarlinRepackLayout() {
    return measureTime("MarlinRepackLayout", [this]() {
        const Size n = 32;
        const Size k = 16;
        // Code (n * 7 + k) % 0x70 keeps every byte a finite value.
        auto weight = Tensor::empty({n, k}, DataType::F8, Device());
        auto *w = reinterpret_cast<uint8_t *>(weight->data());
        for (Size i = 0; i < n; ++i) {
            for (Size j = 0; j < k; ++j) {
                w[i * k + j] = static_cast<uint8_t>((i * 7 + j) % 0x70);
            }
        }

        auto packed = op::marlin_repack_fp8(weight);
        if (packed->dtype() != DataType::I32 || packed->shape() != Shape({1, 128})) {
            SPDLOG_ERROR("Unexpected packed tensor {}", packed->info());
            return false;
        }
        const auto *bytes = reinterpret_cast<const uint8_t *>(packed->data());
        // Second column tile, row n_in = 3, column k_in = 5.
        const Size row = 16 + 3;
        const Size col = 5;
        if (bytes[256 + 3 * 16 + 5] != w[row * k + col]) {
            SPDLOG_ERROR("Byte of weight[{}, {}] is not at its tile position", row, col);
            return false;
        }

        try {
            op::marlin_repack_fp8(Tensor::zeros({20, 16}, DataType::F8, Device()));
            SPDLOG_ERROR("Expected KernelFailure for an untiled weight");
            return false;
        } catch (const KernelFailure &e) {
            SPDLOG_DEBUG("Got expected error: {}", e.what());
        }

        SPDLOG_INFO("✓ Marlin repack layout passed");
        return true;
    });
}

TestResult Fp8KernelTest::testBroadcastAdd() {
    return measureTime("BroadcastAdd", [this]() {
        auto a = makeTensor({1.0f, 2.0f, 3.0f, 4.0f, 5.0f, 6.0f}, {2, 3});
        auto b = makeTensor({10.0f, 20.0f, 30.0f}, {3}, DataType::BF16);
        auto b_view = b->as_strided({2, 3}, {0, 1});
        op::add_(a, a, b_view);
        if (!allClose(toFloats(a), {11.0f, 22.0f, 33.0f, 14.0f, 25.0f, 36.0f}, 0.0, 0.0)) {
            SPDLOG_ERROR("Broadcast add is wrong");
            return false;
        }

        SPDLOG_INFO("✓ Broadcast add passed");
        return true;
    });
}

TestResult Fp8KernelTest::run() {
    std::vector<TestResult> results;
    results.push_back(testE4M3Conversion());
    results.push_back(testPerTokenGroupQuant());
    results.push_back(testStaticQuantRejectsBadScale());
    results.push_back(testMarlinRepackLayout());
    results.push_back(testBroadcastAdd());
    return combine(results);
}

} // namespace fp8core::test
