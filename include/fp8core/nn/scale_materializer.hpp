#pragma once

#include "fp8_linear.hpp"

#include <functional>
#include <vector>

namespace fp8core::nn {

// Reported once per placeholder scale created for a layer.
struct PlaceholderEvent {
    std::string layer;
    std::string scale;
    Shape shape;
    DataType dtype;
    Device device;
};

using PlaceholderObserver = std::function<void(const PlaceholderEvent &)>;

class ScaleMaterializer {
public:
    // Makes every scale the layer's variant requires present, with the right
    // shape, contiguous and on the weight's device. Missing scales become 1.0
    // placeholders. For the packed variant the weight is repacked. Nothing is
    // committed unless the whole run succeeds; later calls are no-ops.
    //
    // Throws ShapeMismatch for a present scale of the wrong shape and
    // UnsupportedVariant when the packed variant cannot tile the weight.
    //
    // The layer's lock is held across device copies and the repack so that
    // concurrent first calls create each placeholder and packed weight once.
    // Readers of a materialized layer never take it.
    static void ensure_scales(Fp8Linear &layer);

    static std::vector<ScaleKind> required_scales(const quantization::QuantVariant &variant,
                                                  const LayerConfig &config);
    static Shape expected_shape(ScaleKind kind,
                                const quantization::QuantVariant &variant,
                                const LayerConfig &config);

    // Pass an empty function to remove the observer.
    static void set_placeholder_observer(PlaceholderObserver observer);

    // Placeholders created by all layers in this process.
    static size_t placeholder_count();
};

} // namespace fp8core::nn
