#include "fp8core/error.hpp"

#include <sstream>

namespace fp8core {

std::string shapeToString(const std::vector<size_t> &shape) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << shape[i];
    }
    oss << "]";
    return oss.str();
}

ShapeMismatch::ShapeMismatch(const std::string &name,
                             const std::vector<size_t> &expected,
                             const std::vector<size_t> &actual)
    : Error("Shape mismatch for '" + name + "': expected " + shapeToString(expected) + ", got " + shapeToString(actual)),
      name_(name),
      expected_(expected),
      actual_(actual) {}

UnsupportedVariant::UnsupportedVariant(const std::string &variant, const Device &device, const std::string &reason)
    : Error("Unsupported quantization variant " + variant + " on " + device.toString() + ": " + reason),
      variant_(variant),
      device_(device) {}

} // namespace fp8core
