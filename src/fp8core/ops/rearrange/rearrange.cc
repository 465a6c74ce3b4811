#include "fp8core/ops/rearrange.hpp"
#include "fp8core/common/utils.hpp"

#include <stdexcept>

namespace fp8core::op {

common::OpDispatcher<Rearrange::schema> &Rearrange::dispatcher() {
    static common::OpDispatcher<Rearrange::schema> dispatcher_;
    return dispatcher_;
}

void Rearrange::execute(Tensor y, Tensor x) {
    FP8CORE_ASSERT_TENSORS_SAME_DEVICE(y, x);
    if (y->shape() != x->shape() || y->dtype() != x->dtype()) {
        throw std::runtime_error("Rearrange requires matching shape and dtype: " + y->info() + " vs " + x->info());
    }
    auto device_type = x->device().getType();
    auto func = dispatcher().lookup(device_type);
    if (func == nullptr) {
        throw std::runtime_error("No Rearrange implementation found for device type: " + Device::toString(device_type));
    }
    func(y, x);
}

Tensor rearrange(Tensor x) {
    auto y = Tensor::empty(x->shape(), x->dtype(), x->device());
    rearrange_(y, x);
    return y;
}

void rearrange_(Tensor y, Tensor x) {
    Rearrange::execute(y, x);
}

} // namespace fp8core::op
