#include "fp8core/memory.hpp"

#include <spdlog/spdlog.h>

namespace fp8core {

Memory::Memory(std::byte *data, size_t size, Device device, Memory::Deleter deleter)
    : data_{data}, size_{size}, device_{device}, deleter_{std::move(deleter)} {
    SPDLOG_TRACE("Memory::Memory() created for memory={} at Device: {}",
                 static_cast<void *>(data), device.toString());
}

Memory::~Memory() {
    if (data_ && deleter_) {
        SPDLOG_TRACE("Memory::~Memory() called for memory={} at Device: {}",
                     static_cast<void *>(data_), device_.toString());
        deleter_(data_);
    }
}

Memory::Memory(Memory &&other) noexcept
    : data_{other.data_}, size_{other.size_}, device_{other.device_},
      deleter_{std::move(other.deleter_)} {
    other.data_ = nullptr;
    other.deleter_ = nullptr;
}

Memory &Memory::operator=(Memory &&other) noexcept {
    if (this != &other) {
        if (data_ && deleter_) {
            deleter_(data_);
        }
        data_ = other.data_;
        size_ = other.size_;
        device_ = other.device_;
        deleter_ = std::move(other.deleter_);

        other.data_ = nullptr;
        other.deleter_ = nullptr;
    }
    return *this;
}

std::byte *Memory::data() const {
    return data_;
}

Device Memory::device() const {
    return device_;
}

size_t Memory::size() const {
    return size_;
}

} // namespace fp8core
