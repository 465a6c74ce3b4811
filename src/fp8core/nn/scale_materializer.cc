#include "fp8core/nn/scale_materializer.hpp"
#include "fp8core/error.hpp"
#include "fp8core/ops/marlin_fp8.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <mutex>
#include <stdexcept>

namespace fp8core::nn {

namespace {

struct ObserverSlot {
    std::mutex mutex;
    PlaceholderObserver observer;
};

ObserverSlot &observerSlot() {
    static ObserverSlot slot;
    return slot;
}

std::atomic<size_t> &globalPlaceholderCount() {
    static std::atomic<size_t> count{0};
    return count;
}

size_t ceilDiv(size_t a, size_t b) {
    return (a + b - 1) / b;
}

void notify(const std::vector<PlaceholderEvent> &events) {
    if (events.empty()) {
        return;
    }
    PlaceholderObserver observer;
    {
        std::lock_guard<std::mutex> lock(observerSlot().mutex);
        observer = observerSlot().observer;
    }
    if (!observer) {
        return;
    }
    for (const auto &event : events) {
        observer(event);
    }
}

} // namespace

std::vector<ScaleKind> ScaleMaterializer::required_scales(const quantization::QuantVariant &variant,
                                                          const LayerConfig &config) {
    struct Visitor {
        const LayerConfig &config;
        std::vector<ScaleKind> operator()(const quantization::StandardVariant &) const {
            if (config.static_activation) {
                return {ScaleKind::WEIGHT_SCALE, ScaleKind::INPUT_SCALE};
            }
            return {ScaleKind::WEIGHT_SCALE};
        }
        std::vector<ScaleKind> operator()(const quantization::BlockVariant &) const {
            return {ScaleKind::WEIGHT_SCALE_INV};
        }
        std::vector<ScaleKind> operator()(const quantization::PackedVariant &) const {
            return {ScaleKind::WEIGHT_SCALE};
        }
    };
    return std::visit(Visitor{config}, variant);
}

Shape ScaleMaterializer::expected_shape(ScaleKind kind,
                                        const quantization::QuantVariant &variant,
                                        const LayerConfig &config) {
    if (kind == ScaleKind::INPUT_SCALE) {
        return {1};
    }

    struct Visitor {
        ScaleKind kind;
        const LayerConfig &config;
        Shape operator()(const quantization::StandardVariant &v) const {
            if (kind != ScaleKind::WEIGHT_SCALE) {
                return {};
            }
            if (v.granularity == quantization::Granularity::CHANNEL) {
                return {config.out_features};
            }
            return {1};
        }
        Shape operator()(const quantization::BlockVariant &v) const {
            if (kind != ScaleKind::WEIGHT_SCALE_INV) {
                return {};
            }
            return {ceilDiv(config.out_features, v.block_n), ceilDiv(config.in_features, v.block_k)};
        }
        Shape operator()(const quantization::PackedVariant &) const {
            if (kind != ScaleKind::WEIGHT_SCALE) {
                return {};
            }
            return {config.out_features};
        }
    };
    Shape shape = std::visit(Visitor{kind, config}, variant);
    if (shape.empty()) {
        throw std::invalid_argument(std::string("Scale '") + scaleName(kind) + "' is not used by variant "
                                    + quantization::toString(variant));
    }
    return shape;
}

void ScaleMaterializer::ensure_scales(Fp8Linear &layer) {
    if (layer.materialized_.load(std::memory_order_acquire)) {
        return;
    }

    const auto &variant = layer.variant();
    const auto &config = layer.config();
    std::vector<PlaceholderEvent> events;

    {
        std::lock_guard<std::mutex> lock(layer.mutex_);
        if (layer.materialized_.load(std::memory_order_relaxed)) {
            return;
        }

        // Staged copies; the layer is only touched once everything succeeded.
        auto scales = layer.scales_;
        Tensor weight = layer.weight_;
        const Device device = weight->device();

        for (auto kind : required_scales(variant, config)) {
            const Shape expected = expected_shape(kind, variant, config);
            auto &slot = scales[size_t(kind)];

            if (!slot.has_value() || !*slot) {
                slot = Tensor::ones(expected, config.params_dtype, device);
                events.push_back({config.prefix, scaleName(kind), expected, config.params_dtype, device});
                continue;
            }

            Tensor scale = *slot;
            if (scale->shape() != expected) {
                throw ShapeMismatch(scaleName(kind), expected, scale->shape());
            }
            if (!isFloatingPoint(scale->dtype())) {
                throw Error(std::string("Scale '") + scaleName(kind) + "' of layer '" + config.prefix
                            + "' must be floating point, got " + toString(scale->dtype()));
            }
            if (scale->device() != device) {
                SPDLOG_DEBUG("Moving scale '{}' of layer '{}' from {} to {}",
                             scaleName(kind), config.prefix, scale->device().toString(), device.toString());
                scale = scale->to(device);
            }
            slot = scale->contiguous();
        }

        bool repacked = layer.repacked_;
        if (std::holds_alternative<quantization::PackedVariant>(variant) && !repacked) {
            if (config.out_features % op::MARLIN_TILE != 0 || config.in_features % op::MARLIN_TILE != 0) {
                throw UnsupportedVariant(quantization::toString(variant), device,
                                         "weight " + shapeToString({config.out_features, config.in_features})
                                             + " is not a multiple of the " + std::to_string(op::MARLIN_TILE)
                                             + " packing tile");
            }
            weight = op::marlin_repack_fp8(weight);
            repacked = true;
        }

        layer.scales_ = std::move(scales);
        layer.weight_ = weight;
        layer.repacked_ = repacked;
        layer.placeholder_count_.fetch_add(events.size());
        globalPlaceholderCount().fetch_add(events.size());
        layer.materialized_.store(true, std::memory_order_release);
    }

    for (const auto &event : events) {
        SPDLOG_WARN("Layer '{}': no '{}' was loaded, using a placeholder of ones {} ({}, {})",
                    event.layer, event.scale, shapeToString(event.shape), toString(event.dtype),
                    event.device.toString());
    }
    SPDLOG_DEBUG("Layer '{}' materialized as {} with {} placeholder(s)",
                 config.prefix, quantization::toString(variant), events.size());
    notify(events);
}

void ScaleMaterializer::set_placeholder_observer(PlaceholderObserver observer) {
    std::lock_guard<std::mutex> lock(observerSlot().mutex);
    observerSlot().observer = std::move(observer);
}

size_t ScaleMaterializer::placeholder_count() {
    return globalPlaceholderCount().load();
}

} // namespace fp8core::nn
