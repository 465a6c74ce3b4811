#pragma once
#include "fp8core/context/context.hpp"

namespace fp8core {

class CpuRuntime : public Runtime {
public:
    std::byte *allocate(size_t size, const Device &device) override;
    void deallocate(std::byte *ptr, const Device &device) override;

    void memcpyH2D(void *dst, const void *src, size_t size, const Device &device) override;
    void memcpyD2H(void *dst, const void *src, size_t size, const Device &device) override;
    void memcpyD2D(void *dst, const void *src, size_t size, const Device &device) override;
};

} // namespace fp8core
