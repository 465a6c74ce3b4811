#ifndef __FP8CORE_MEMORY_API_HPP__
#define __FP8CORE_MEMORY_API_HPP__

#include "device.hpp"

#include <cstddef>
#include <functional>

namespace fp8core {

class Memory {
public:
    using Deleter = std::function<void(std::byte *)>;

    Memory(std::byte *data, size_t size, Device device, Deleter deleter);
    ~Memory();

    Memory(const Memory &) = delete;
    Memory &operator=(const Memory &) = delete;

    Memory(Memory &&other) noexcept;
    Memory &operator=(Memory &&other) noexcept;

    std::byte *data() const;
    Device device() const;
    size_t size() const;

private:
    std::byte *data_;
    size_t size_;
    Device device_;
    Deleter deleter_;
};

} // namespace fp8core

#endif
