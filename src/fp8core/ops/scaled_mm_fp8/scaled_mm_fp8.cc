#include "fp8core/ops/scaled_mm_fp8.hpp"
#include "fp8core/common/utils.hpp"

#include <stdexcept>

namespace fp8core::op {

common::OpDispatcher<ScaledMMFp8::schema> &ScaledMMFp8::dispatcher() {
    static common::OpDispatcher<ScaledMMFp8::schema> dispatcher_;
    return dispatcher_;
}

void ScaledMMFp8::execute(Tensor c, Tensor a, Tensor a_scale, Tensor b, Tensor b_scale) {
    FP8CORE_ASSERT_TENSORS_SAME_DEVICE(c, a, a_scale, b, b_scale);
    auto device_type = c->device().getType();
    auto func = dispatcher().lookup(device_type);
    if (func == nullptr) {
        throw std::runtime_error("No ScaledMMFp8 implementation found for device type: " + Device::toString(device_type));
    }
    func(c, a, a_scale, b, b_scale);
}

void scaled_mm_fp8_(Tensor c, Tensor a, Tensor a_scale, Tensor b, Tensor b_scale) {
    ScaledMMFp8::execute(c, a, a_scale, b, b_scale);
}

} // namespace fp8core::op
