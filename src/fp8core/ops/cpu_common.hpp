#pragma once

#include "fp8core/common/utils.hpp"
#include "fp8core/tensor.hpp"

#include <vector>

namespace fp8core::op::cpu {

inline float load(const std::byte *base, DataType dtype, Stride offset) {
    return readFloat(base + offset * static_cast<Stride>(dsize(dtype)), dtype);
}

inline void store(std::byte *base, DataType dtype, Stride offset, float value) {
    convertFloat(value, dtype, base + offset * static_cast<Stride>(dsize(dtype)));
}

inline Stride offsetOf(const std::vector<Size> &index, const Strides &strides) {
    Stride offset = 0;
    for (size_t i = 0; i < index.size(); ++i) {
        offset += static_cast<Stride>(index[i]) * strides[i];
    }
    return offset;
}

// Calls fn(index) for every multi-index of shape in row-major order.
template <typename Fn>
void forEachIndex(const Shape &shape, Fn &&fn) {
    for (Size extent : shape) {
        if (extent == 0) {
            return;
        }
    }
    std::vector<Size> index(shape.size(), 0);
    while (true) {
        fn(index);
        size_t dim = shape.size();
        while (dim > 0) {
            --dim;
            if (++index[dim] < shape[dim]) {
                break;
            }
            index[dim] = 0;
            if (dim == 0) {
                return;
            }
        }
        if (shape.empty()) {
            return;
        }
    }
}

// Element i of a scale vector: a single value broadcasts.
inline float scaleAt(const Tensor &scale, Size i) {
    if (scale->numel() == 1) {
        return load(scale->data(), scale->dtype(), 0);
    }
    return load(scale->data(), scale->dtype(), static_cast<Stride>(i));
}

inline bool isRowMajor2D(const Tensor &t) {
    return t->ndim() == 2 && (t->size(1) <= 1 || t->stride(1) == 1);
}

inline bool isColMajor2D(const Tensor &t) {
    return t->ndim() == 2 && (t->size(0) <= 1 || t->stride(0) == 1);
}

// Decodes a 2D tensor into a dense row-major float buffer.
inline std::vector<float> decode2D(const Tensor &t) {
    const Size rows = t->size(0);
    const Size cols = t->size(1);
    std::vector<float> out(rows * cols);
    const std::byte *base = t->data();
    for (Size r = 0; r < rows; ++r) {
        for (Size c = 0; c < cols; ++c) {
            out[r * cols + c] = load(base, t->dtype(),
                                     static_cast<Stride>(r) * t->stride(0) + static_cast<Stride>(c) * t->stride(1));
        }
    }
    return out;
}

} // namespace fp8core::op::cpu
