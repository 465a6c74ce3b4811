#include "../cpu_common.hpp"
#include "fp8core/ops/add.hpp"

namespace fp8core::op::add_impl::cpu {

void calculate(Tensor c, Tensor a, Tensor b) {
    FP8CORE_KERNEL_CHECK(isFloatingPoint(c->dtype()) && isFloatingPoint(a->dtype()) && isFloatingPoint(b->dtype()),
                         "add", "only floating dtypes are supported");
    std::byte *c_base = c->data();
    const std::byte *a_base = a->data();
    const std::byte *b_base = b->data();

    op::cpu::forEachIndex(c->shape(), [&](const std::vector<Size> &index) {
        float av = op::cpu::load(a_base, a->dtype(), op::cpu::offsetOf(index, a->strides()));
        float bv = op::cpu::load(b_base, b->dtype(), op::cpu::offsetOf(index, b->strides()));
        op::cpu::store(c_base, c->dtype(), op::cpu::offsetOf(index, c->strides()), av + bv);
    });
}

static bool registered = []() {
    Add::dispatcher().registerDevice(Device::Type::CPU, &calculate);
    return true;
}();

} // namespace fp8core::op::add_impl::cpu
