#ifndef __FP8CORE_DEVICE_API_HPP__
#define __FP8CORE_DEVICE_API_HPP__

#include <cstddef>
#include <cstdint>
#include <string>

namespace fp8core {

class Device {
public:
    using Index = std::size_t;

    enum class Type {
        CPU,
        CUDA,
        COUNT,
    };

    Device(const Type &type = Type::CPU, const Index &index = 0);

    const Type &getType() const;

    const Index &getIndex() const;

    std::string toString() const;

    static std::string toString(const Type &type);

    bool operator==(const Device &other) const;

    bool operator!=(const Device &other) const;

private:
    Type type_;

    Index index_;
};

} // namespace fp8core

#endif
