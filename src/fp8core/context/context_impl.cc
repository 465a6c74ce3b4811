#include "context_impl.hpp"
#include "runtime/cpu_runtime.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace fp8core {

ContextImpl::ContextImpl() {
    runtime_table_[size_t(Device::Type::CPU)] = std::make_shared<CpuRuntime>();
}

void ContextImpl::registerRuntime(Device::Type type, std::shared_ptr<Runtime> runtime) {
    if (type == Device::Type::COUNT) {
        throw std::out_of_range("Invalid device type for runtime registration");
    }
    std::lock_guard<std::mutex> lock(runtime_table_mutex_);
    runtime_table_[size_t(type)] = std::move(runtime);
    SPDLOG_INFO("Registered runtime for device type {}", Device::toString(type));
}

std::shared_ptr<Runtime> ContextImpl::getRuntime(Device::Type type) const {
    if (type == Device::Type::COUNT) {
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(runtime_table_mutex_);
    return runtime_table_[size_t(type)];
}

ContextImpl &ContextImpl::singleton() {
    // Leaked on purpose so that tensors destroyed during static teardown can still free memory.
    static ContextImpl *instance = new ContextImpl();
    return *instance;
}

namespace context {

void registerRuntime(Device::Type type, std::shared_ptr<Runtime> runtime) {
    ContextImpl::singleton().registerRuntime(type, std::move(runtime));
}

bool hasRuntime(Device::Type type) {
    return ContextImpl::singleton().getRuntime(type) != nullptr;
}

namespace {
std::shared_ptr<Runtime> requireRuntime(const Device &device) {
    auto runtime = ContextImpl::singleton().getRuntime(device.getType());
    if (!runtime) {
        throw std::runtime_error("No runtime registered for device " + device.toString());
    }
    return runtime;
}
} // namespace

Runtime &getRuntime(const Device &device) {
    return *requireRuntime(device);
}

std::shared_ptr<Memory> allocateMemory(size_t size, const Device &device) {
    auto runtime = requireRuntime(device);
    std::byte *data = runtime->allocate(size, device);
    // The deleter holds the runtime so memory outlives a later re-registration.
    return std::make_shared<Memory>(
        data, size, device,
        [runtime, device](std::byte *ptr) { runtime->deallocate(ptr, device); });
}

void memcpyH2D(void *dst, const void *src, size_t size, const Device &device) {
    requireRuntime(device)->memcpyH2D(dst, src, size, device);
}

void memcpyD2H(void *dst, const void *src, size_t size, const Device &device) {
    requireRuntime(device)->memcpyD2H(dst, src, size, device);
}

void memcpyD2D(void *dst, const void *src, size_t size, const Device &device) {
    requireRuntime(device)->memcpyD2D(dst, src, size, device);
}

} // namespace context

} // namespace fp8core
