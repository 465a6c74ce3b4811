#pragma once

#include "../device.hpp"

#include <array>
#include <mutex>

namespace fp8core::op::common {

// Per-device table of kernel entry points for one op. Back ends register at
// static-initialization time; afterwards the table is only read.
template <typename Fn>
class OpDispatcher {
public:
    void registerDevice(Device::Type device_type, Fn fn, bool override_existing = true) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto &slot = table_[size_t(device_type)];
        if (slot == nullptr || override_existing) {
            slot = fn;
        }
    }

    void registerAll(Fn fn, bool override_existing = true) {
        for (size_t i = 0; i < size_t(Device::Type::COUNT); ++i) {
            registerDevice(static_cast<Device::Type>(i), fn, override_existing);
        }
    }

    void unregisterDevice(Device::Type device_type) {
        std::lock_guard<std::mutex> lock(mutex_);
        table_[size_t(device_type)] = nullptr;
    }

    Fn lookup(Device::Type device_type) const {
        if (device_type == Device::Type::COUNT) {
            return nullptr;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return table_[size_t(device_type)];
    }

    bool supports(Device::Type device_type) const {
        return lookup(device_type) != nullptr;
    }

private:
    std::array<Fn, size_t(Device::Type::COUNT)> table_{};
    mutable std::mutex mutex_;
};

} // namespace fp8core::op::common
