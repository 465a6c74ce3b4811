#include "fp8core/ops/block_scaled_mm_fp8.hpp"
#include "fp8core/common/utils.hpp"

#include <stdexcept>

namespace fp8core::op {

common::OpDispatcher<BlockScaledMMFp8::schema> &BlockScaledMMFp8::dispatcher() {
    static common::OpDispatcher<BlockScaledMMFp8::schema> dispatcher_;
    return dispatcher_;
}

void BlockScaledMMFp8::execute(Tensor c, Tensor a, Tensor a_scale, Tensor b, Tensor b_scale,
                               Size block_n, Size block_k) {
    FP8CORE_ASSERT_TENSORS_SAME_DEVICE(c, a, a_scale, b, b_scale);
    if (block_n == 0 || block_k == 0) {
        throw std::runtime_error("BlockScaledMMFp8: block sizes must be positive");
    }
    auto device_type = c->device().getType();
    auto func = dispatcher().lookup(device_type);
    if (func == nullptr) {
        throw std::runtime_error("No BlockScaledMMFp8 implementation found for device type: " + Device::toString(device_type));
    }
    func(c, a, a_scale, b, b_scale, block_n, block_k);
}

void block_scaled_mm_fp8_(Tensor c, Tensor a, Tensor a_scale, Tensor b, Tensor b_scale,
                          Size block_n, Size block_k) {
    BlockScaledMMFp8::execute(c, a, a_scale, b, b_scale, block_n, block_k);
}

} // namespace fp8core::op
