#include "fp8core/dtype.hpp"
#include "../utils/custom_types.h"

#include <cstdint>
#include <cstring>
#include <stdexcept>

namespace fp8core {

std::string toString(const DataType &dtype) {
    switch (dtype) {
    case DataType::BYTE:
        return "BYTE";
    case DataType::BOOL:
        return "BOOL";
    case DataType::I8:
        return "I8";
    case DataType::I16:
        return "I16";
    case DataType::I32:
        return "I32";
    case DataType::I64:
        return "I64";
    case DataType::U8:
        return "U8";
    case DataType::F8:
        return "F8";
    case DataType::F16:
        return "F16";
    case DataType::BF16:
        return "BF16";
    case DataType::F32:
        return "F32";
    case DataType::F64:
        return "F64";
    }
    throw std::runtime_error("Unknown dtype " + std::to_string(static_cast<int>(dtype)));
}

size_t dsize(const DataType &dtype) {
    switch (dtype) {
    case DataType::BYTE:
    case DataType::BOOL:
    case DataType::F8:
    case DataType::I8:
    case DataType::U8:
        return 1;
    case DataType::I16:
    case DataType::F16:
    case DataType::BF16:
        return 2;
    case DataType::I32:
    case DataType::F32:
        return 4;
    case DataType::I64:
    case DataType::F64:
        return 8;
    }
    throw std::runtime_error("Unknown dtype " + std::to_string(static_cast<int>(dtype)));
}

bool isFloatingPoint(const DataType &dtype) {
    switch (dtype) {
    case DataType::F8:
    case DataType::F16:
    case DataType::BF16:
    case DataType::F32:
    case DataType::F64:
        return true;
    default:
        return false;
    }
}

void convertFloat(double value, DataType dtype, void *buffer) {
    switch (dtype) {
    case DataType::F32: {
        float f32_val = static_cast<float>(value);
        std::memcpy(buffer, &f32_val, sizeof(float));
        break;
    }
    case DataType::F64: {
        std::memcpy(buffer, &value, sizeof(double));
        break;
    }
    case DataType::F16: {
        fp16_t h = _f32_to_f16(static_cast<float>(value));
        std::memcpy(buffer, &h, sizeof(fp16_t));
        break;
    }
    case DataType::BF16: {
        bf16_t b = _f32_to_bf16(static_cast<float>(value));
        std::memcpy(buffer, &b, sizeof(bf16_t));
        break;
    }
    case DataType::F8: {
        fp8_e4m3_t q = _f32_to_f8e4m3(static_cast<float>(value));
        std::memcpy(buffer, &q, sizeof(fp8_e4m3_t));
        break;
    }
    default:
        throw std::runtime_error("Unsupported dtype for float conversion: " + toString(dtype));
    }
}

float readFloat(const void *buffer, DataType dtype) {
    switch (dtype) {
    case DataType::F32: {
        float v;
        std::memcpy(&v, buffer, sizeof(float));
        return v;
    }
    case DataType::F64: {
        double v;
        std::memcpy(&v, buffer, sizeof(double));
        return static_cast<float>(v);
    }
    case DataType::F16: {
        fp16_t h;
        std::memcpy(&h, buffer, sizeof(fp16_t));
        return _f16_to_f32(h);
    }
    case DataType::BF16: {
        bf16_t b;
        std::memcpy(&b, buffer, sizeof(bf16_t));
        return _bf16_to_f32(b);
    }
    case DataType::F8: {
        fp8_e4m3_t q;
        std::memcpy(&q, buffer, sizeof(fp8_e4m3_t));
        return _f8e4m3_to_f32(q);
    }
    default:
        throw std::runtime_error("Unsupported dtype for float read: " + toString(dtype));
    }
}

} // namespace fp8core
