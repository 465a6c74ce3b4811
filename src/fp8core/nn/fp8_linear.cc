#include "fp8core/nn/fp8_linear.hpp"
#include "fp8core/error.hpp"
#include "fp8core/nn/matmul_dispatcher.hpp"
#include "fp8core/nn/scale_materializer.hpp"
#include "fp8core/quantization/variant_resolver.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <vector>

namespace fp8core::nn {

const char *scaleName(ScaleKind kind) {
    switch (kind) {
    case ScaleKind::WEIGHT_SCALE:
        return "weight_scale";
    case ScaleKind::WEIGHT_SCALE_INV:
        return "weight_scale_inv";
    case ScaleKind::INPUT_SCALE:
        return "input_scale";
    default:
        return "unknown";
    }
}

std::optional<ScaleKind> scaleKindFromName(const std::string &name) {
    for (size_t i = 0; i < size_t(ScaleKind::COUNT); ++i) {
        auto kind = static_cast<ScaleKind>(i);
        if (name == scaleName(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

Fp8Linear::Fp8Linear(LayerConfig config, const Device &device)
    : config_(std::move(config)),
      device_(device) {
    if (config_.in_features == 0 || config_.out_features == 0) {
        throw std::invalid_argument("Fp8Linear '" + config_.prefix + "' needs non-zero in_features and out_features");
    }
    if (!isFloatingPoint(config_.params_dtype) || config_.params_dtype == DataType::F8) {
        throw std::invalid_argument("Fp8Linear params_dtype must be a wide floating type, got "
                                    + toString(config_.params_dtype));
    }

    weight_ = Tensor::zeros({config_.out_features, config_.in_features}, DataType::F8, device_);
    if (config_.bias) {
        bias_ = Tensor::zeros({config_.out_features}, config_.params_dtype, device_);
    }

    SPDLOG_DEBUG("Created Fp8Linear '{}': in_features={}, out_features={}, bias={}, device={}",
                 config_.prefix, config_.in_features, config_.out_features, config_.bias, device_.toString());
}

void Fp8Linear::check_not_frozen(const std::string &name) const {
    if (materialized_.load(std::memory_order_acquire)) {
        throw std::runtime_error("Cannot load '" + name + "' into Fp8Linear '" + config_.prefix
                                 + "': the layer is already materialized");
    }
}

Fp8Linear::StagedParameter Fp8Linear::stage_parameter(const std::string &name, const Tensor &tensor) const {
    if (name == "weight") {
        if (!tensor) {
            throw std::runtime_error("Fp8Linear '" + config_.prefix + "': weight must be defined");
        }
        if (tensor->dtype() != DataType::F8) {
            throw Error("Fp8Linear '" + config_.prefix + "': weight must be F8, got " + toString(tensor->dtype()));
        }
        const Shape expected{config_.out_features, config_.in_features};
        if (tensor->shape() != expected) {
            throw ShapeMismatch("weight", expected, tensor->shape());
        }
        return {name, std::nullopt, tensor->to(device_)};
    }

    if (name == "bias") {
        if (!config_.bias) {
            throw std::runtime_error("Fp8Linear '" + config_.prefix + "' was built without bias");
        }
        if (!tensor) {
            throw std::runtime_error("Fp8Linear '" + config_.prefix + "': bias must be defined");
        }
        const Shape expected{config_.out_features};
        if (tensor->shape() != expected) {
            throw ShapeMismatch("bias", expected, tensor->shape());
        }
        if (!isFloatingPoint(tensor->dtype()) || tensor->dtype() == DataType::F8) {
            throw Error("Fp8Linear '" + config_.prefix + "': bias must be a wide floating type, got "
                        + toString(tensor->dtype()));
        }
        return {name, std::nullopt, tensor->to(device_)};
    }

    auto kind = scaleKindFromName(name);
    if (!kind.has_value()) {
        throw std::out_of_range("Fp8Linear '" + config_.prefix + "' has no parameter named '" + name + "'");
    }
    // Validated at materialization, once the variant is known.
    return {name, kind, tensor};
}

void Fp8Linear::commit_parameter(StagedParameter staged) {
    if (staged.scale.has_value()) {
        scales_[size_t(*staged.scale)] = std::move(staged.tensor);
    } else if (staged.name == "weight") {
        weight_ = std::move(staged.tensor);
    } else {
        bias_ = std::move(staged.tensor);
    }
}

void Fp8Linear::load_parameter(const std::string &name, const Tensor &tensor) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_not_frozen(name);
    commit_parameter(stage_parameter(name, tensor));
}

void Fp8Linear::load_state_dict(const std::unordered_map<std::string, Tensor> &state_dict) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StagedParameter> staged;
    staged.reserve(state_dict.size());
    for (const auto &[name, tensor] : state_dict) {
        check_not_frozen(name);
        staged.push_back(stage_parameter(name, tensor));
    }
    // Nothing is assigned unless every entry passed.
    for (auto &parameter : staged) {
        commit_parameter(std::move(parameter));
    }
}

std::unordered_map<std::string, Tensor> Fp8Linear::state_dict() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_map<std::string, Tensor> result;
    result.emplace("weight", weight_);
    if (bias_.has_value()) {
        result.emplace("bias", *bias_);
    }
    for (size_t i = 0; i < scales_.size(); ++i) {
        if (scales_[i].has_value() && *scales_[i]) {
            result.emplace(scaleName(static_cast<ScaleKind>(i)), *scales_[i]);
        }
    }
    return result;
}

const quantization::QuantVariant &Fp8Linear::variant() const {
    std::call_once(variant_once_, [this]() {
        variant_ = quantization::VariantResolver::resolve(config_);
        SPDLOG_DEBUG("Fp8Linear '{}' resolved to {}", config_.prefix, quantization::toString(*variant_));
    });
    return *variant_;
}

void Fp8Linear::process_weights_after_loading() {
    ScaleMaterializer::ensure_scales(*this);
}

Tensor Fp8Linear::forward(const Tensor &input) {
    return MatMulDispatcher::apply(*this, input);
}

// Fields are never written once materialized_ is set, so frozen reads skip
// the lock.
Tensor Fp8Linear::weight() const {
    if (is_materialized()) {
        return weight_;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return weight_;
}

std::optional<Tensor> Fp8Linear::bias() const {
    if (is_materialized()) {
        return bias_;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return bias_;
}

std::optional<Tensor> Fp8Linear::scale(ScaleKind kind) const {
    if (is_materialized()) {
        return scales_.at(size_t(kind));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return scales_.at(size_t(kind));
}

bool Fp8Linear::is_repacked() const {
    if (is_materialized()) {
        return repacked_;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return repacked_;
}

std::string Fp8Linear::extra_repr() const {
    return "Fp8Linear(in_features=" + std::to_string(config_.in_features) + ", out_features=" + std::to_string(config_.out_features) + ", bias=" + (config_.bias ? "true" : "false") + ", variant=" + quantization::toString(variant()) + ")";
}

} // namespace fp8core::nn
