#pragma once

#include "device.hpp"
#include "dtype.hpp"
#include "memory.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace fp8core {

using Size = std::size_t;
using Stride = std::ptrdiff_t;
using Shape = std::vector<Size>;
using Strides = std::vector<Stride>;

class TensorImpl;

struct TensorMetaData {
    Shape shape;
    Strides strides;
    DataType dtype;
};

struct TensorData {
    std::shared_ptr<Memory> memory;
    // Offset of element [0, ..., 0] from the start of memory, in bytes.
    size_t offset = 0;
};

struct TensorSliceParams {
    Size dim;
    Size start;
    Size len;
};

class Tensor {
public:
    Tensor() = default;
    explicit Tensor(std::shared_ptr<TensorImpl> impl) : impl_(std::move(impl)) {}

    static Tensor empty(const Shape &shape, const DataType &dtype, const Device &device);
    static Tensor zeros(const Shape &shape, const DataType &dtype, const Device &device);
    static Tensor ones(const Shape &shape, const DataType &dtype, const Device &device);
    static Tensor full(const Shape &shape, double value, const DataType &dtype, const Device &device);

    // Wraps caller-owned memory without taking ownership.
    static Tensor from_blob(void *data, const Shape &shape, const DataType &dtype, const Device &device);
    static Tensor strided_from_blob(void *data, const Shape &shape, const Strides &strides,
                                    const DataType &dtype, const Device &device);

    TensorImpl *operator->() const;
    TensorImpl *get() const { return impl_.get(); }

    explicit operator bool() const { return impl_ != nullptr; }

    // Identity, not value, comparison.
    bool is_same(const Tensor &other) const { return impl_ == other.impl_; }

private:
    std::shared_ptr<TensorImpl> impl_;
};

class TensorImpl : public std::enable_shared_from_this<TensorImpl> {
public:
    TensorImpl(const Shape &shape, const DataType &dtype);
    TensorImpl(const Shape &shape, const Strides &strides, const DataType &dtype);

    std::byte *data();
    const std::byte *data() const;

    const Shape &shape() const;
    const Strides &strides() const;
    Size size(size_t dim) const;
    Stride stride(size_t dim) const;
    Size ndim() const;
    Size numel() const;
    DataType dtype() const;
    Device device() const;
    size_t element_size() const;
    size_t nbytes() const;

    bool is_contiguous() const;

    // Reinterprets a contiguous tensor with a new shape of the same numel.
    Tensor view(const Shape &new_shape) const;
    Tensor permute(const Shape &order) const;
    Tensor as_strided(const Shape &new_shape, const Strides &new_strides) const;
    Tensor narrow(const std::vector<TensorSliceParams> &slices) const;

    Tensor contiguous() const;
    Tensor to(Device device) const;
    void copy_from(Tensor src);

    std::string info() const;

    static Strides contiguous_strides(const Shape &shape);

private:
    friend class Tensor;

    Tensor share(const Shape &shape, const Strides &strides, size_t offset) const;

    TensorMetaData meta_;
    TensorData data_;
};

} // namespace fp8core
