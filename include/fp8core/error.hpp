#ifndef __FP8CORE_ERROR_API_HPP__
#define __FP8CORE_ERROR_API_HPP__

#include "device.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace fp8core {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string &message) : std::runtime_error(message) {}
};

// A tensor (usually a scale attached by the loader) does not have the shape the
// resolved quantization variant requires. Never retried.
class ShapeMismatch : public Error {
public:
    ShapeMismatch(const std::string &name,
                  const std::vector<size_t> &expected,
                  const std::vector<size_t> &actual);

    const std::string &name() const { return name_; }
    const std::vector<size_t> &expected() const { return expected_; }
    const std::vector<size_t> &actual() const { return actual_; }

private:
    std::string name_;
    std::vector<size_t> expected_;
    std::vector<size_t> actual_;
};

// The resolved variant has no kernel entry point on the layer's device, or the
// layer's shape cannot be served by that entry point.
class UnsupportedVariant : public Error {
public:
    UnsupportedVariant(const std::string &variant, const Device &device, const std::string &reason);

    const std::string &variant() const { return variant_; }
    const Device &device() const { return device_; }

private:
    std::string variant_;
    Device device_;
};

// Raised by kernels. The dispatcher propagates it unchanged.
class KernelFailure : public Error {
public:
    KernelFailure(const std::string &kernel, const std::string &reason)
        : Error(kernel + ": " + reason), kernel_(kernel) {}

    const std::string &kernel() const { return kernel_; }

private:
    std::string kernel_;
};

std::string shapeToString(const std::vector<size_t> &shape);

} // namespace fp8core

#endif
