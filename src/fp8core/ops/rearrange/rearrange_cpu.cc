#include "../cpu_common.hpp"
#include "fp8core/ops/rearrange.hpp"

#include <cstring>

namespace fp8core::op::rearrange_impl::cpu {

void calculate(Tensor y, Tensor x) {
    const size_t element_size = x->element_size();
    const Stride esize = static_cast<Stride>(element_size);
    std::byte *y_base = y->data();
    const std::byte *x_base = x->data();

    op::cpu::forEachIndex(x->shape(), [&](const std::vector<Size> &index) {
        std::memcpy(y_base + op::cpu::offsetOf(index, y->strides()) * esize,
                    x_base + op::cpu::offsetOf(index, x->strides()) * esize,
                    element_size);
    });
}

static bool registered = []() {
    Rearrange::dispatcher().registerDevice(Device::Type::CPU, &calculate);
    return true;
}();

} // namespace fp8core::op::rearrange_impl::cpu
