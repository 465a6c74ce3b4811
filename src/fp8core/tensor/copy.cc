#include "fp8core/context/context.hpp"
#include "fp8core/ops/rearrange.hpp"
#include "fp8core/tensor.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace fp8core {

Tensor TensorImpl::to(Device device) const {
    if (device == this->device()) {
        return Tensor(const_cast<TensorImpl *>(this)->shared_from_this());
    }
    auto result = Tensor::empty(meta_.shape, meta_.dtype, device);
    result->copy_from(Tensor(const_cast<TensorImpl *>(this)->shared_from_this()));
    return result;
}

void TensorImpl::copy_from(Tensor src) {
    if (src->shape() != this->shape()) {
        throw std::runtime_error("Cannot copy from tensor with different shape");
    }
    if (src->dtype() != this->dtype()) {
        throw std::runtime_error("Cannot copy from tensor with different dtype");
    }
    Tensor self(shared_from_this());

    if (this->device() == src->device()) {
        if (this->is_contiguous() && src->is_contiguous()) {
            SPDLOG_TRACE("[COPY] copy_from: both contiguous, direct copy of {} bytes", nbytes());
            context::memcpyD2D(this->data(), src->data(), nbytes(), this->device());
        } else {
            SPDLOG_TRACE("[COPY] copy_from: not both contiguous, using rearrange_");
            op::rearrange_(self, src);
        }
        return;
    }

    if (!src->is_contiguous()) {
        SPDLOG_TRACE("[COPY] copy_from: making src contiguous before cross-device copy");
        src = src->contiguous();
    }

    if (this->device().getType() == Device::Type::CPU) {
        SPDLOG_TRACE("[COPY] copy_from: D2H from {}", src->device().toString());
        if (this->is_contiguous()) {
            context::memcpyD2H(this->data(), src->data(), nbytes(), src->device());
        } else {
            auto local_src = Tensor::empty(this->shape(), this->dtype(), this->device());
            context::memcpyD2H(local_src->data(), src->data(), nbytes(), src->device());
            op::rearrange_(self, local_src);
        }
    } else if (src->device().getType() == Device::Type::CPU) {
        SPDLOG_TRACE("[COPY] copy_from: H2D to {}", this->device().toString());
        if (this->is_contiguous()) {
            context::memcpyH2D(this->data(), src->data(), nbytes(), this->device());
        } else {
            auto local_src = Tensor::empty(this->shape(), this->dtype(), this->device());
            context::memcpyH2D(local_src->data(), src->data(), nbytes(), this->device());
            op::rearrange_(self, local_src);
        }
    } else {
        // Accelerator to accelerator goes through the host.
        copy_from(src->to(Device(Device::Type::CPU)));
    }
}

Tensor TensorImpl::contiguous() const {
    if (is_contiguous()) {
        return Tensor(const_cast<TensorImpl *>(this)->shared_from_this());
    }
    return op::rearrange(Tensor(const_cast<TensorImpl *>(this)->shared_from_this()));
}

} // namespace fp8core
