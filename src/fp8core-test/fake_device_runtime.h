#ifndef __FP8CORE_TEST_FAKE_DEVICE_RUNTIME_H__
#define __FP8CORE_TEST_FAKE_DEVICE_RUNTIME_H__

#include "fp8core/context/context.hpp"

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <future>
#include <memory>
#include <mutex>
#include <new>

namespace fp8core::test {

// Accelerator runtime backed by host memory. Registered for Device::Type::CUDA
// so device placement paths run without hardware. No kernels are registered
// for it.
class FakeDeviceRuntime : public Runtime {
public:
    std::byte *allocate(size_t size, const Device &) override {
        void *ptr = std::malloc(size == 0 ? 1 : size);
        if (ptr == nullptr) {
            throw std::bad_alloc();
        }
        ++allocations;
        return static_cast<std::byte *>(ptr);
    }

    void deallocate(std::byte *ptr, const Device &) override {
        std::free(ptr);
    }

    void memcpyH2D(void *dst, const void *src, size_t size, const Device &) override {
        std::shared_future<void> gate;
        {
            std::lock_guard<std::mutex> lock(gate_mutex_);
            gate = gate_;
        }
        if (gate.valid()) {
            ++blocked_copies;
            gate.wait();
        }
        ++h2d_copies;
        std::memcpy(dst, src, size);
    }

    // Host-to-device copies issued while a gate is set wait until it is ready.
    // An invalid future removes the gate.
    void setCopyGate(std::shared_future<void> gate) {
        std::lock_guard<std::mutex> lock(gate_mutex_);
        gate_ = std::move(gate);
    }

    void memcpyD2H(void *dst, const void *src, size_t size, const Device &) override {
        std::memcpy(dst, src, size);
    }

    void memcpyD2D(void *dst, const void *src, size_t size, const Device &) override {
        std::memcpy(dst, src, size);
    }

    std::atomic<size_t> allocations{0};
    std::atomic<size_t> h2d_copies{0};
    std::atomic<size_t> blocked_copies{0};

private:
    std::mutex gate_mutex_;
    std::shared_future<void> gate_;
};

inline std::shared_ptr<FakeDeviceRuntime> installFakeDevice() {
    auto runtime = std::make_shared<FakeDeviceRuntime>();
    context::registerRuntime(Device::Type::CUDA, runtime);
    return runtime;
}

} // namespace fp8core::test

#endif // __FP8CORE_TEST_FAKE_DEVICE_RUNTIME_H__
