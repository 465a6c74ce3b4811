#ifndef __FP8CORE_CONTEXT_API_HPP__
#define __FP8CORE_CONTEXT_API_HPP__

#include "../device.hpp"
#include "../memory.hpp"

#include <cstddef>
#include <memory>

namespace fp8core {

// Allocation and copy services of one device type. The CPU runtime is built in;
// accelerator back ends register theirs with context::registerRuntime.
class Runtime {
public:
    virtual ~Runtime() = default;

    virtual std::byte *allocate(size_t size, const Device &device) = 0;
    virtual void deallocate(std::byte *ptr, const Device &device) = 0;

    virtual void memcpyH2D(void *dst, const void *src, size_t size, const Device &device) = 0;
    virtual void memcpyD2H(void *dst, const void *src, size_t size, const Device &device) = 0;
    virtual void memcpyD2D(void *dst, const void *src, size_t size, const Device &device) = 0;

    virtual void synchronize(const Device &) {}
};

namespace context {

void registerRuntime(Device::Type type, std::shared_ptr<Runtime> runtime);

bool hasRuntime(Device::Type type);

// Throws std::runtime_error when no runtime is registered for the device type.
// The reference stays valid until a runtime is registered again for that type.
Runtime &getRuntime(const Device &device);

std::shared_ptr<Memory> allocateMemory(size_t size, const Device &device);

void memcpyH2D(void *dst, const void *src, size_t size, const Device &device);
void memcpyD2H(void *dst, const void *src, size_t size, const Device &device);
void memcpyD2D(void *dst, const void *src, size_t size, const Device &device);

} // namespace context

} // namespace fp8core

#endif
