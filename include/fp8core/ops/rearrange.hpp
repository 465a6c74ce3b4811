#pragma once

#include "../common/dispatcher.hpp"
#include "../tensor.hpp"

namespace fp8core::op {

class Rearrange {
public:
    using schema = void (*)(Tensor, Tensor);
    static void execute(Tensor y, Tensor x);
    static common::OpDispatcher<schema> &dispatcher();
};

// Returns a contiguous copy of x.
Tensor rearrange(Tensor x);
// Copies x into y element by element, honoring both layouts.
void rearrange_(Tensor y, Tensor x);

} // namespace fp8core::op
