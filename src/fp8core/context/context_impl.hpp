#pragma once
#include "fp8core/context/context.hpp"

#include <array>
#include <memory>
#include <mutex>

namespace fp8core {

class ContextImpl {
private:
    // One runtime per device type. Slot for CPU is filled at construction.
    std::array<std::shared_ptr<Runtime>, size_t(Device::Type::COUNT)> runtime_table_;
    mutable std::mutex runtime_table_mutex_;

protected:
    ContextImpl();

public:
    void registerRuntime(Device::Type type, std::shared_ptr<Runtime> runtime);

    std::shared_ptr<Runtime> getRuntime(Device::Type type) const;

    static ContextImpl &singleton();
};

} // namespace fp8core
