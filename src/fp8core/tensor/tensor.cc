#include "fp8core/context/context.hpp"
#include "fp8core/error.hpp"
#include "fp8core/tensor.hpp"

#include <algorithm>
#include <cstring>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace fp8core {

namespace {

Size shapeNumel(const Shape &shape) {
    return std::accumulate(shape.begin(), shape.end(), Size{1}, std::multiplies<Size>());
}

std::string stridesToString(const Strides &strides) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < strides.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << strides[i];
    }
    oss << "]";
    return oss.str();
}

} // namespace

TensorImpl *Tensor::operator->() const {
    if (!impl_) {
        throw std::runtime_error("Access to an undefined tensor");
    }
    return impl_.get();
}

Tensor Tensor::empty(const Shape &shape, const DataType &dtype, const Device &device) {
    auto impl = std::make_shared<TensorImpl>(shape, dtype);
    impl->data_.memory = context::allocateMemory(shapeNumel(shape) * dsize(dtype), device);
    return Tensor(impl);
}

Tensor Tensor::full(const Shape &shape, double value, const DataType &dtype, const Device &device) {
    const size_t elem = dsize(dtype);
    std::vector<std::byte> pattern(elem);
    convertFloat(value, dtype, pattern.data());

    auto fill_host = [&](std::byte *dst, Size count) {
        for (Size i = 0; i < count; ++i) {
            std::memcpy(dst + i * elem, pattern.data(), elem);
        }
    };

    auto tensor = empty(shape, dtype, device);
    const Size numel = tensor->numel();
    if (device.getType() == Device::Type::CPU) {
        fill_host(tensor->data(), numel);
    } else {
        // Stage on the host and upload in one copy so the result is never
        // visible half-filled.
        std::vector<std::byte> staging(numel * elem);
        fill_host(staging.data(), numel);
        context::memcpyH2D(tensor->data(), staging.data(), staging.size(), device);
    }
    return tensor;
}

Tensor Tensor::zeros(const Shape &shape, const DataType &dtype, const Device &device) {
    return full(shape, 0.0, dtype, device);
}

Tensor Tensor::ones(const Shape &shape, const DataType &dtype, const Device &device) {
    return full(shape, 1.0, dtype, device);
}

Tensor Tensor::from_blob(void *data, const Shape &shape, const DataType &dtype, const Device &device) {
    return strided_from_blob(data, shape, TensorImpl::contiguous_strides(shape), dtype, device);
}

Tensor Tensor::strided_from_blob(void *data, const Shape &shape, const Strides &strides,
                                 const DataType &dtype, const Device &device) {
    auto impl = std::make_shared<TensorImpl>(shape, strides, dtype);
    // No deleter: the caller keeps ownership of the buffer.
    impl->data_.memory = std::make_shared<Memory>(static_cast<std::byte *>(data), 0, device, nullptr);
    return Tensor(impl);
}

TensorImpl::TensorImpl(const Shape &shape, const DataType &dtype)
    : TensorImpl(shape, contiguous_strides(shape), dtype) {}

TensorImpl::TensorImpl(const Shape &shape, const Strides &strides, const DataType &dtype) {
    if (shape.size() != strides.size()) {
        throw std::runtime_error("Shape and strides rank mismatch");
    }
    meta_.shape = shape;
    meta_.strides = strides;
    meta_.dtype = dtype;
}

Strides TensorImpl::contiguous_strides(const Shape &shape) {
    Strides strides(shape.size());
    Stride stride = 1;
    for (size_t i = shape.size(); i-- > 0;) {
        strides[i] = stride;
        stride *= static_cast<Stride>(shape[i]);
    }
    return strides;
}

std::byte *TensorImpl::data() {
    return data_.memory->data() + data_.offset;
}

const std::byte *TensorImpl::data() const {
    return data_.memory->data() + data_.offset;
}

const Shape &TensorImpl::shape() const {
    return meta_.shape;
}

const Strides &TensorImpl::strides() const {
    return meta_.strides;
}

Size TensorImpl::size(size_t dim) const {
    return meta_.shape.at(dim);
}

Stride TensorImpl::stride(size_t dim) const {
    return meta_.strides.at(dim);
}

Size TensorImpl::ndim() const {
    return meta_.shape.size();
}

Size TensorImpl::numel() const {
    return shapeNumel(meta_.shape);
}

DataType TensorImpl::dtype() const {
    return meta_.dtype;
}

Device TensorImpl::device() const {
    return data_.memory->device();
}

size_t TensorImpl::element_size() const {
    return dsize(meta_.dtype);
}

size_t TensorImpl::nbytes() const {
    return numel() * element_size();
}

bool TensorImpl::is_contiguous() const {
    Stride expected = 1;
    for (size_t i = meta_.shape.size(); i-- > 0;) {
        if (meta_.shape[i] == 1) {
            continue;
        }
        if (meta_.strides[i] != expected) {
            return false;
        }
        expected *= static_cast<Stride>(meta_.shape[i]);
    }
    return true;
}

Tensor TensorImpl::share(const Shape &shape, const Strides &strides, size_t offset) const {
    auto impl = std::make_shared<TensorImpl>(shape, strides, meta_.dtype);
    impl->data_.memory = data_.memory;
    impl->data_.offset = offset;
    return Tensor(impl);
}

Tensor TensorImpl::view(const Shape &new_shape) const {
    if (shapeNumel(new_shape) != numel()) {
        throw std::runtime_error("Cannot view tensor of shape " + shapeToString(meta_.shape)
                                 + " as " + shapeToString(new_shape));
    }
    if (!is_contiguous()) {
        throw std::runtime_error("view() requires a contiguous tensor, got " + info());
    }
    return share(new_shape, contiguous_strides(new_shape), data_.offset);
}

Tensor TensorImpl::permute(const Shape &order) const {
    if (order.size() != ndim()) {
        throw std::runtime_error("permute() order rank does not match tensor rank");
    }
    std::vector<bool> seen(ndim(), false);
    Shape shape(ndim());
    Strides strides(ndim());
    for (size_t i = 0; i < order.size(); ++i) {
        if (order[i] >= ndim() || seen[order[i]]) {
            throw std::runtime_error("permute() order is not a permutation");
        }
        seen[order[i]] = true;
        shape[i] = meta_.shape[order[i]];
        strides[i] = meta_.strides[order[i]];
    }
    return share(shape, strides, data_.offset);
}

Tensor TensorImpl::as_strided(const Shape &new_shape, const Strides &new_strides) const {
    return share(new_shape, new_strides, data_.offset);
}

Tensor TensorImpl::narrow(const std::vector<TensorSliceParams> &slices) const {
    Shape shape = meta_.shape;
    size_t offset = data_.offset;
    for (const auto &slice : slices) {
        if (slice.dim >= ndim() || slice.start + slice.len > meta_.shape[slice.dim]) {
            throw std::out_of_range("narrow() slice out of range for " + info());
        }
        shape[slice.dim] = slice.len;
        offset += slice.start * static_cast<size_t>(meta_.strides[slice.dim]) * element_size();
    }
    return share(shape, meta_.strides, offset);
}

std::string TensorImpl::info() const {
    std::ostringstream oss;
    oss << "Tensor(shape=" << shapeToString(meta_.shape)
        << ", strides=" << stridesToString(meta_.strides)
        << ", dtype=" << toString(meta_.dtype)
        << ", device=" << device().toString() << ")";
    return oss.str();
}

} // namespace fp8core
