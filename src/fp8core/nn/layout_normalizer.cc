#include "fp8core/nn/layout_normalizer.hpp"

#include <spdlog/spdlog.h>

#include <optional>
#include <stdexcept>

namespace fp8core::nn {

namespace {

// Row stride of [batch, K] when the leading dims of `t` fold into one axis
// without a copy. Extent-1 axes are ignored.
std::optional<Stride> collapsedRowStride(const Tensor &t) {
    const size_t ndim = t->ndim();
    const Size k = t->size(ndim - 1);
    if (k > 1 && t->stride(ndim - 1) != 1) {
        return std::nullopt;
    }

    std::optional<Stride> row_stride;
    Stride expected = 0;
    for (size_t d = ndim - 1; d-- > 0;) {
        const Size extent = t->size(d);
        if (extent == 1) {
            continue;
        }
        if (!row_stride.has_value()) {
            row_stride = t->stride(d);
        } else if (t->stride(d) != expected) {
            return std::nullopt;
        }
        expected = t->stride(d) * static_cast<Stride>(extent);
    }
    if (!row_stride.has_value()) {
        row_stride = static_cast<Stride>(k);
    }
    return row_stride;
}

} // namespace

OperandView LayoutNormalizer::normalize_activation(const Tensor &activation) {
    if (activation->ndim() == 0) {
        throw std::runtime_error("normalize_activation expects at least one dimension, got " + activation->info());
    }
    const Size k = activation->shape().back();
    const Size batch = k == 0 ? 0 : activation->numel() / k;

    if (auto row_stride = collapsedRowStride(activation)) {
        return {activation->as_strided({batch, k}, {*row_stride, 1}), false};
    }

    SPDLOG_DEBUG("normalize_activation: compacting {}", activation->info());
    return {activation->contiguous()->view({batch, k}), true};
}

OperandView LayoutNormalizer::normalize_weight(const Tensor &weight) {
    if (weight->ndim() != 2) {
        throw std::runtime_error("normalize_weight expects a 2D [N, K] weight, got " + weight->info());
    }
    if (weight->size(1) <= 1 || weight->stride(1) == 1) {
        return {weight->permute({1, 0}), false};
    }

    SPDLOG_DEBUG("normalize_weight: compacting {}", weight->info());
    return {weight->contiguous()->permute({1, 0}), true};
}

OperandView LayoutNormalizer::normalize_scale(const Tensor &scale) {
    if (scale->is_contiguous()) {
        return {scale, false};
    }
    return {scale->contiguous(), true};
}

std::pair<OperandView, OperandView> LayoutNormalizer::normalize(const Tensor &activation, const Tensor &weight) {
    return {normalize_activation(activation), normalize_weight(weight)};
}

} // namespace fp8core::nn
