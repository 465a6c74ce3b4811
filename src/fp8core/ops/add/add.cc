#include "fp8core/ops/add.hpp"
#include "fp8core/common/utils.hpp"

#include <stdexcept>

namespace fp8core::op {

common::OpDispatcher<Add::schema> &Add::dispatcher() {
    static common::OpDispatcher<Add::schema> dispatcher_;
    return dispatcher_;
}

void Add::execute(Tensor c, Tensor a, Tensor b) {
    FP8CORE_ASSERT_TENSORS_SAME_DEVICE(c, a, b);
    if (c->shape() != a->shape() || c->shape() != b->shape()) {
        throw std::runtime_error("Add requires operands of identical (broadcast) shape");
    }
    auto device_type = c->device().getType();
    auto func = dispatcher().lookup(device_type);
    if (func == nullptr) {
        throw std::runtime_error("No Add implementation found for device type: " + Device::toString(device_type));
    }
    func(c, a, b);
}

Tensor add(Tensor a, Tensor b) {
    auto c = Tensor::empty(a->shape(), a->dtype(), a->device());
    add_(c, a, b);
    return c;
}

void add_(Tensor c, Tensor a, Tensor b) {
    Add::execute(c, a, b);
}

} // namespace fp8core::op
