#include "custom_types.h"

#include <cmath>
#include <cstring>

float _f16_to_f32(fp16_t val) {
    uint16_t h = val._v;
    uint32_t sign = (h & 0x8000) << 16;
    int32_t exponent = (h >> 10) & 0x1F;
    uint32_t mantissa = h & 0x3FF;

    uint32_t f32;
    if (exponent == 31) {
        f32 = sign | 0x7F800000 | (mantissa << 13);
    } else if (exponent == 0) {
        if (mantissa == 0) {
            f32 = sign;
        } else {
            exponent = -14;
            while ((mantissa & 0x400) == 0) {
                mantissa <<= 1;
                exponent--;
            }
            mantissa &= 0x3FF;
            f32 = sign | (static_cast<uint32_t>(exponent + 127) << 23) | (mantissa << 13);
        }
    } else {
        f32 = sign | (static_cast<uint32_t>(exponent + 127 - 15) << 23) | (mantissa << 13);
    }

    float result;
    std::memcpy(&result, &f32, sizeof(result));
    return result;
}

fp16_t _f32_to_f16(float val) {
    uint32_t f32;
    std::memcpy(&f32, &val, sizeof(f32));
    uint16_t sign = static_cast<uint16_t>((f32 >> 16) & 0x8000);
    int32_t exponent = static_cast<int32_t>((f32 >> 23) & 0xFF) - 127;
    uint32_t mantissa = f32 & 0x7FFFFF;

    if (exponent == 128) {
        // Inf or NaN
        return fp16_t{static_cast<uint16_t>(sign | 0x7C00 | (mantissa ? 0x200 : 0))};
    }
    if (exponent > 15) {
        return fp16_t{static_cast<uint16_t>(sign | 0x7C00)};
    }
    if (exponent >= -14) {
        uint32_t half_mant = mantissa >> 13;
        uint32_t rest = mantissa & 0x1FFF;
        uint32_t h = (static_cast<uint32_t>(exponent + 15) << 10) | half_mant;
        if (rest > 0x1000 || (rest == 0x1000 && (half_mant & 1))) {
            ++h;
        }
        return fp16_t{static_cast<uint16_t>(sign | h)};
    }
    if (exponent >= -24) {
        mantissa |= 0x800000;
        int shift = -exponent - 1;
        uint32_t half_mant = mantissa >> shift;
        uint32_t rest = mantissa & ((1u << shift) - 1);
        uint32_t halfway = 1u << (shift - 1);
        if (rest > halfway || (rest == halfway && (half_mant & 1))) {
            ++half_mant;
        }
        return fp16_t{static_cast<uint16_t>(sign | half_mant)};
    }
    return fp16_t{sign};
}

float _bf16_to_f32(bf16_t val) {
    uint32_t bits32 = static_cast<uint32_t>(val._v) << 16;
    float out;
    std::memcpy(&out, &bits32, sizeof(out));
    return out;
}

bf16_t _f32_to_bf16(float val) {
    uint32_t bits32;
    std::memcpy(&bits32, &val, sizeof(bits32));
    if (std::isnan(val)) {
        return bf16_t{static_cast<uint16_t>((bits32 >> 16) | 0x40)};
    }
    // round-to-nearest-even on bit 16
    const uint32_t rounding_bias = 0x00007FFF + ((bits32 >> 16) & 1);
    return bf16_t{static_cast<uint16_t>((bits32 + rounding_bias) >> 16)};
}

float _f8e4m3_to_f32(fp8_e4m3_t val) {
    const uint8_t v = val._v;
    const bool negative = (v & 0x80) != 0;
    const int exponent = (v >> 3) & 0xF;
    const int mantissa = v & 0x7;

    float result;
    if (exponent == 0xF && mantissa == 0x7) {
        result = std::nanf("");
    } else if (exponent == 0) {
        result = std::ldexp(static_cast<float>(mantissa), -9);
    } else {
        result = std::ldexp(1.0f + static_cast<float>(mantissa) / 8.0f, exponent - 7);
    }
    return negative ? -result : result;
}

fp8_e4m3_t _f32_to_f8e4m3(float val) {
    const uint8_t sign = std::signbit(val) ? 0x80 : 0x00;
    if (std::isnan(val)) {
        return fp8_e4m3_t{static_cast<uint8_t>(sign | 0x7F)};
    }
    const float a = std::fabs(val);
    if (a >= FP8_E4M3_MAX) {
        return fp8_e4m3_t{static_cast<uint8_t>(sign | 0x7E)};
    }

    int e = 0;
    std::frexp(a, &e);
    // a = 1.m * 2^(e - 1)
    int exponent = e - 1;
    if (a == 0.0f || exponent < -6) {
        // Subnormal range, quantum 2^-9. q == 8 encodes the smallest normal.
        const float q = std::nearbyint(std::ldexp(a, 9));
        return fp8_e4m3_t{static_cast<uint8_t>(sign | static_cast<uint8_t>(q))};
    }

    float q = std::nearbyint(std::ldexp(a, 3 - exponent));
    if (q >= 16.0f) {
        q = 8.0f;
        ++exponent;
    }
    const uint8_t code = static_cast<uint8_t>(((exponent + 7) << 3) | (static_cast<int>(q) - 8));
    if (code > 0x7E) {
        return fp8_e4m3_t{static_cast<uint8_t>(sign | 0x7E)};
    }
    return fp8_e4m3_t{static_cast<uint8_t>(sign | code)};
}
