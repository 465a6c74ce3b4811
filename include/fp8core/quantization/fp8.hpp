#pragma once

#include "../nn/layer_config.hpp"
#include "base_quantization.hpp"

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fp8core::quantization {

struct HardwareCapability {
    // Native FP8 GEMM (W8A8) is available.
    bool fp8_supported = true;
    bool per_channel_supported = true;
    // Route every non-block layer through the packed weight-only kernel.
    bool force_marlin = false;

    // CPU reference capability, with force_marlin taken from
    // FP8CORE_FORCE_FP8_MARLIN.
    static HardwareCapability detect();
};

class Fp8 : public BaseQuantization {
    // quant_method "fp8": activation_scheme "dynamic" | "static",
    // optional weight_block_size [n, k], optional ignored_layers.
public:
    explicit Fp8(const nlohmann::json &quant_config, HardwareCapability capability = HardwareCapability::detect());

    QuantScheme get_quant_scheme() const override;

    bool is_static_activation() const { return static_activation_; }
    const std::optional<std::array<size_t, 2>> &weight_block_size() const { return weight_block_size_; }
    bool use_marlin() const;
    const HardwareCapability &capability() const { return capability_; }

    bool is_layer_skipped(const std::string &prefix) const;

    nn::LayerConfig make_layer_config(const std::string &prefix,
                                      size_t in_features,
                                      size_t out_features,
                                      bool bias,
                                      DataType params_dtype = DataType::F32) const;

private:
    HardwareCapability capability_;
    bool static_activation_ = false;
    std::optional<std::array<size_t, 2>> weight_block_size_;
    std::vector<std::string> ignored_layers_;
};

// Picks the config class from `quant_method`. Throws std::runtime_error for
// unknown methods.
std::unique_ptr<BaseQuantization> make_quantization(const nlohmann::json &quant_config);

} // namespace fp8core::quantization
