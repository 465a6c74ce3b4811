#pragma once

#include "../tensor.hpp"

#include <utility>

namespace fp8core::nn {

// A kernel operand for one call. `copied` is set when the layout could not be
// produced as a view.
struct OperandView {
    Tensor tensor;
    bool copied = false;
};

class LayoutNormalizer {
public:
    // Activation [..., K] -> row-major [batch, K].
    static OperandView normalize_activation(const Tensor &activation);
    // Weight [N, K] -> column-major [K, N] (stride(0) == 1).
    static OperandView normalize_weight(const Tensor &weight);
    // Any scale tensor -> contiguous.
    static OperandView normalize_scale(const Tensor &scale);

    static std::pair<OperandView, OperandView> normalize(const Tensor &activation, const Tensor &weight);
};

} // namespace fp8core::nn
