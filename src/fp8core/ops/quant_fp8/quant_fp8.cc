#include "fp8core/ops/quant_fp8.hpp"
#include "fp8core/common/utils.hpp"

#include <stdexcept>

namespace fp8core::op {

common::OpDispatcher<StaticScaledFp8Quant::schema> &StaticScaledFp8Quant::dispatcher() {
    static common::OpDispatcher<StaticScaledFp8Quant::schema> dispatcher_;
    return dispatcher_;
}

void StaticScaledFp8Quant::execute(Tensor x_q, Tensor x, Tensor scale) {
    FP8CORE_ASSERT_TENSORS_SAME_DEVICE(x_q, x, scale);
    if (x_q->shape() != x->shape()) {
        throw std::runtime_error("StaticScaledFp8Quant: output shape " + shapeToString(x_q->shape())
                                 + " does not match input shape " + shapeToString(x->shape()));
    }
    auto device_type = x->device().getType();
    auto func = dispatcher().lookup(device_type);
    if (func == nullptr) {
        throw std::runtime_error("No StaticScaledFp8Quant implementation found for device type: " + Device::toString(device_type));
    }
    func(x_q, x, scale);
}

void static_scaled_fp8_quant_(Tensor x_q, Tensor x, Tensor scale) {
    StaticScaledFp8Quant::execute(x_q, x, scale);
}

common::OpDispatcher<PerTokenGroupQuantFp8::schema> &PerTokenGroupQuantFp8::dispatcher() {
    static common::OpDispatcher<PerTokenGroupQuantFp8::schema> dispatcher_;
    return dispatcher_;
}

void PerTokenGroupQuantFp8::execute(Tensor x_q, Tensor x_scale, Tensor x, Size group_size) {
    FP8CORE_ASSERT_TENSORS_SAME_DEVICE(x_q, x_scale, x);
    if (x->ndim() != 2 || x_q->shape() != x->shape()) {
        throw std::runtime_error("PerTokenGroupQuantFp8 expects matching 2D input and output, got "
                                 + x->info() + " and " + x_q->info());
    }
    if (group_size == 0) {
        throw std::runtime_error("PerTokenGroupQuantFp8: group_size must be positive");
    }
    auto device_type = x->device().getType();
    auto func = dispatcher().lookup(device_type);
    if (func == nullptr) {
        throw std::runtime_error("No PerTokenGroupQuantFp8 implementation found for device type: " + Device::toString(device_type));
    }
    func(x_q, x_scale, x, group_size);
}

void per_token_group_quant_fp8_(Tensor x_q, Tensor x_scale, Tensor x, Size group_size) {
    PerTokenGroupQuantFp8::execute(x_q, x_scale, x, group_size);
}

} // namespace fp8core::op
