#ifndef __FP8CORE_DTYPE_API_HPP__
#define __FP8CORE_DTYPE_API_HPP__

#include <cstddef>
#include <string>

namespace fp8core {

enum class DataType {
    BYTE,
    BOOL,
    I8,
    I16,
    I32,
    I64,
    U8,
    // E4M3FN: 1 sign, 4 exponent, 3 mantissa bits, no infinities, max 448.
    F8,
    F16,
    BF16,
    F32,
    F64,
};

std::string toString(const DataType &dtype);

size_t dsize(const DataType &dtype);

bool isFloatingPoint(const DataType &dtype);

// Writes `value` converted to `dtype` into `buffer`. Floating dtypes only.
void convertFloat(double value, DataType dtype, void *buffer);

// Reads one element of `dtype` from `buffer` as a float.
float readFloat(const void *buffer, DataType dtype);

} // namespace fp8core

#endif
