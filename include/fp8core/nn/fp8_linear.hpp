#pragma once

#include "../quantization/quant_variant.hpp"
#include "../tensor.hpp"
#include "layer_config.hpp"

#include <array>
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fp8core::nn {

enum class ScaleKind {
    WEIGHT_SCALE,
    WEIGHT_SCALE_INV,
    INPUT_SCALE,
    COUNT
};

const char *scaleName(ScaleKind kind);
std::optional<ScaleKind> scaleKindFromName(const std::string &name);

// FP8 linear layer: y = x @ dequant(weight)^T (+ bias).
//
// Parameters are attached by the loader, then the layer is materialized once
// (eagerly by process_weights_after_loading() or lazily by the first
// forward()). After that it is frozen: weight and scales are read-only and
// forward() may run from several threads.
class Fp8Linear {
public:
    explicit Fp8Linear(LayerConfig config, const Device &device = Device());

    Fp8Linear(const Fp8Linear &) = delete;
    Fp8Linear &operator=(const Fp8Linear &) = delete;

    // Names: weight, bias, weight_scale, weight_scale_inv, input_scale.
    // An undefined tensor clears a scale slot. Throws std::runtime_error once
    // the layer is materialized.
    void load_parameter(const std::string &name, const Tensor &tensor);
    // All entries are checked before any is assigned.
    void load_state_dict(const std::unordered_map<std::string, Tensor> &state_dict);
    std::unordered_map<std::string, Tensor> state_dict() const;

    // Resolved on first use and cached.
    const quantization::QuantVariant &variant() const;

    void process_weights_after_loading();

    Tensor forward(const Tensor &input);

    std::string extra_repr() const;

    const LayerConfig &config() const { return config_; }
    Device device() const { return device_; }
    // Lock-free once the layer is materialized.
    Tensor weight() const;
    std::optional<Tensor> bias() const;
    std::optional<Tensor> scale(ScaleKind kind) const;
    bool is_materialized() const { return materialized_.load(std::memory_order_acquire); }
    // True once the weight holds the packed layout.
    bool is_repacked() const;
    size_t placeholder_count() const { return placeholder_count_.load(); }

private:
    friend class ScaleMaterializer;

    struct StagedParameter {
        std::string name;
        std::optional<ScaleKind> scale;
        Tensor tensor;
    };

    void check_not_frozen(const std::string &name) const;
    StagedParameter stage_parameter(const std::string &name, const Tensor &tensor) const;
    void commit_parameter(StagedParameter staged);

    LayerConfig config_;
    Device device_;

    Tensor weight_;
    std::optional<Tensor> bias_;
    std::array<std::optional<Tensor>, size_t(ScaleKind::COUNT)> scales_;
    bool repacked_ = false;

    mutable std::once_flag variant_once_;
    mutable std::optional<quantization::QuantVariant> variant_;

    mutable std::mutex mutex_;
    std::atomic<bool> materialized_{false};
    std::atomic<size_t> placeholder_count_{0};
};

} // namespace fp8core::nn
