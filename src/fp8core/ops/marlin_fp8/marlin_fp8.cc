#include "fp8core/ops/marlin_fp8.hpp"
#include "fp8core/common/utils.hpp"

#include <stdexcept>

namespace fp8core::op {

Shape marlin_packed_shape(Size size_n, Size size_k) {
    return {size_k / MARLIN_TILE, size_n * MARLIN_TILE / 4};
}

common::OpDispatcher<MarlinRepackFp8::schema> &MarlinRepackFp8::dispatcher() {
    static common::OpDispatcher<MarlinRepackFp8::schema> dispatcher_;
    return dispatcher_;
}

void MarlinRepackFp8::execute(Tensor packed, Tensor weight) {
    FP8CORE_ASSERT_TENSORS_SAME_DEVICE(packed, weight);
    auto device_type = weight->device().getType();
    auto func = dispatcher().lookup(device_type);
    if (func == nullptr) {
        throw std::runtime_error("No MarlinRepackFp8 implementation found for device type: " + Device::toString(device_type));
    }
    func(packed, weight);
}

Tensor marlin_repack_fp8(Tensor weight) {
    if (weight->ndim() != 2) {
        throw std::runtime_error("marlin_repack_fp8 expects a 2D weight, got " + weight->info());
    }
    auto packed = Tensor::empty(marlin_packed_shape(weight->size(0), weight->size(1)), DataType::I32, weight->device());
    marlin_repack_fp8_(packed, weight);
    return packed;
}

void marlin_repack_fp8_(Tensor packed, Tensor weight) {
    MarlinRepackFp8::execute(packed, weight);
}

common::OpDispatcher<MarlinGemmFp8::schema> &MarlinGemmFp8::dispatcher() {
    static common::OpDispatcher<MarlinGemmFp8::schema> dispatcher_;
    return dispatcher_;
}

void MarlinGemmFp8::execute(Tensor c, Tensor a, Tensor b_packed, Tensor b_scale, Size size_n, Size size_k) {
    FP8CORE_ASSERT_TENSORS_SAME_DEVICE(c, a, b_packed, b_scale);
    auto device_type = c->device().getType();
    auto func = dispatcher().lookup(device_type);
    if (func == nullptr) {
        throw std::runtime_error("No MarlinGemmFp8 implementation found for device type: " + Device::toString(device_type));
    }
    func(c, a, b_packed, b_scale, size_n, size_k);
}

void marlin_gemm_fp8_(Tensor c, Tensor a, Tensor b_packed, Tensor b_scale, Size size_n, Size size_k) {
    MarlinGemmFp8::execute(c, a, b_packed, b_scale, size_n, size_k);
}

} // namespace fp8core::op
