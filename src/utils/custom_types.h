#ifndef __FP8UTILS_CUSTOM_TYPES_H__
#define __FP8UTILS_CUSTOM_TYPES_H__
#include <stdint.h>
#include <type_traits>

struct CustomFloat16 {
    uint16_t _v;
};
typedef struct CustomFloat16 fp16_t;

struct CustomBFloat16 {
    uint16_t _v;
};
typedef struct CustomBFloat16 bf16_t;

// FP8 E4M3FN: exponent bias 7, no infinities, 0x7F/0xFF are NaN, max finite 448.
struct CustomFloat8E4M3 {
    uint8_t _v;
};
typedef struct CustomFloat8E4M3 fp8_e4m3_t;

constexpr float FP8_E4M3_MAX = 448.0f;

float _f16_to_f32(fp16_t val);
fp16_t _f32_to_f16(float val);

float _bf16_to_f32(bf16_t val);
bf16_t _f32_to_bf16(float val);

float _f8e4m3_to_f32(fp8_e4m3_t val);
// Round to nearest even, saturating to +-448.
fp8_e4m3_t _f32_to_f8e4m3(float val);

namespace utils {

template <typename TypeTo, typename TypeFrom>
TypeTo cast(TypeFrom val) {
    if constexpr (std::is_same<TypeTo, TypeFrom>::value) {
        return val;
    } else if constexpr (std::is_same<TypeFrom, fp16_t>::value) {
        return static_cast<TypeTo>(_f16_to_f32(val));
    } else if constexpr (std::is_same<TypeFrom, bf16_t>::value) {
        return static_cast<TypeTo>(_bf16_to_f32(val));
    } else if constexpr (std::is_same<TypeFrom, fp8_e4m3_t>::value) {
        return static_cast<TypeTo>(_f8e4m3_to_f32(val));
    } else if constexpr (std::is_same<TypeTo, fp16_t>::value) {
        return _f32_to_f16(static_cast<float>(val));
    } else if constexpr (std::is_same<TypeTo, bf16_t>::value) {
        return _f32_to_bf16(static_cast<float>(val));
    } else if constexpr (std::is_same<TypeTo, fp8_e4m3_t>::value) {
        return _f32_to_f8e4m3(static_cast<float>(val));
    } else {
        return static_cast<TypeTo>(val);
    }
}

} // namespace utils

#endif
