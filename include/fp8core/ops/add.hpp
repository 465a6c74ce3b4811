#pragma once

#include "../common/dispatcher.hpp"
#include "../tensor.hpp"

namespace fp8core::op {

class Add {
public:
    using schema = void (*)(Tensor, Tensor, Tensor);
    static void execute(Tensor c, Tensor a, Tensor b);
    static common::OpDispatcher<schema> &dispatcher();
};

Tensor add(Tensor a, Tensor b);
// c = a + b. Operands may broadcast through zero strides; c may alias a.
void add_(Tensor c, Tensor a, Tensor b);

} // namespace fp8core::op
