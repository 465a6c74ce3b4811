#include "cpu_runtime.hpp"

#include <cstdlib>
#include <cstring>
#include <new>

namespace fp8core {

namespace {
constexpr size_t kCpuAlignment = 64;
}

std::byte *CpuRuntime::allocate(size_t size, const Device &) {
    // aligned_alloc needs a multiple of the alignment and a non-zero size
    size_t rounded = ((size + kCpuAlignment - 1) / kCpuAlignment) * kCpuAlignment;
    if (rounded == 0) {
        rounded = kCpuAlignment;
    }
    void *ptr = std::aligned_alloc(kCpuAlignment, rounded);
    if (ptr == nullptr) {
        throw std::bad_alloc();
    }
    return static_cast<std::byte *>(ptr);
}

void CpuRuntime::deallocate(std::byte *ptr, const Device &) {
    std::free(ptr);
}

void CpuRuntime::memcpyH2D(void *dst, const void *src, size_t size, const Device &) {
    std::memcpy(dst, src, size);
}

void CpuRuntime::memcpyD2H(void *dst, const void *src, size_t size, const Device &) {
    std::memcpy(dst, src, size);
}

void CpuRuntime::memcpyD2D(void *dst, const void *src, size_t size, const Device &) {
    std::memcpy(dst, src, size);
}

} // namespace fp8core
