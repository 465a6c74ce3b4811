#include "fp8core/quantization/fp8.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>

namespace fp8core::quantization {

namespace {

bool envFlag(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr) {
        return false;
    }
    return std::strcmp(value, "1") == 0 || std::strcmp(value, "true") == 0 || std::strcmp(value, "TRUE") == 0;
}

} // namespace

HardwareCapability HardwareCapability::detect() {
    HardwareCapability capability;
    capability.force_marlin = envFlag("FP8CORE_FORCE_FP8_MARLIN");
    if (capability.force_marlin) {
        SPDLOG_INFO("FP8CORE_FORCE_FP8_MARLIN is set, non-block FP8 layers use the packed kernel");
    }
    return capability;
}

Fp8::Fp8(const nlohmann::json &quant_config, HardwareCapability capability)
    : BaseQuantization(quant_config), capability_(capability) {
    const auto method = get_or<std::string>("quant_method", "fp8");
    if (method != "fp8") {
        throw std::runtime_error("Fp8 quantization config has quant_method '" + method + "'");
    }

    const auto scheme = get_or<std::string>("activation_scheme", "dynamic");
    if (scheme == "static") {
        static_activation_ = true;
    } else if (scheme != "dynamic") {
        throw std::runtime_error("Unsupported activation_scheme '" + scheme + "', expected 'dynamic' or 'static'");
    }

    if (quant_config_.contains("weight_block_size") && !quant_config_.at("weight_block_size").is_null()) {
        auto block = get<std::vector<size_t>>("weight_block_size");
        if (block.size() != 2) {
            throw std::runtime_error("weight_block_size must have 2 entries, got " + std::to_string(block.size()));
        }
        if (static_activation_) {
            throw std::runtime_error("Block-wise FP8 quantization only supports the dynamic activation scheme");
        }
        weight_block_size_ = std::array<size_t, 2>{block[0], block[1]};
    }

    ignored_layers_ = get_or<std::vector<std::string>>("ignored_layers", {});

    SPDLOG_DEBUG("Fp8 config: activation_scheme={}, block={}, ignored_layers={}, marlin={}",
                 scheme, weight_block_size_.has_value(), ignored_layers_.size(), use_marlin());
}

QuantScheme Fp8::get_quant_scheme() const {
    return weight_block_size_.has_value() ? QuantScheme::FP8_BLOCK_W8A8 : QuantScheme::FP8_W8A8;
}

bool Fp8::use_marlin() const {
    // The packed kernel has no block-wise scales.
    if (weight_block_size_.has_value()) {
        return false;
    }
    return !capability_.fp8_supported || capability_.force_marlin;
}

bool Fp8::is_layer_skipped(const std::string &prefix) const {
    for (const auto &ignored : ignored_layers_) {
        if (prefix == ignored) {
            return true;
        }
        if (prefix.size() > ignored.size() && prefix.compare(0, ignored.size(), ignored) == 0
            && prefix[ignored.size()] == '.') {
            return true;
        }
    }
    return false;
}

nn::LayerConfig Fp8::make_layer_config(const std::string &prefix,
                                       size_t in_features,
                                       size_t out_features,
                                       bool bias,
                                       DataType params_dtype) const {
    if (is_layer_skipped(prefix)) {
        throw std::invalid_argument("Layer '" + prefix + "' is listed in ignored_layers and is not FP8 quantized");
    }
    nn::LayerConfig config;
    config.in_features = in_features;
    config.out_features = out_features;
    config.per_channel_supported = capability_.per_channel_supported;
    config.weight_block_size = weight_block_size_;
    config.use_marlin = use_marlin();
    config.static_activation = static_activation_;
    config.bias = bias;
    config.params_dtype = params_dtype;
    config.prefix = prefix;
    return config;
}

std::unique_ptr<BaseQuantization> make_quantization(const nlohmann::json &quant_config) {
    if (!quant_config.contains("quant_method")) {
        throw std::runtime_error("Quantization config has no quant_method");
    }
    const auto method = quant_config.at("quant_method").get<std::string>();
    if (method == "fp8") {
        return std::make_unique<Fp8>(quant_config);
    }
    throw std::runtime_error("Unsupported quant_method '" + method + "'");
}

} // namespace fp8core::quantization
