#include "fp8core/nn/matmul_dispatcher.hpp"
#include "fp8core/error.hpp"
#include "fp8core/nn/layout_normalizer.hpp"
#include "fp8core/nn/scale_materializer.hpp"
#include "fp8core/ops.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace fp8core::nn {

namespace {

Tensor requireScale(const Fp8Linear &layer, ScaleKind kind) {
    auto scale = layer.scale(kind);
    if (!scale.has_value() || !*scale) {
        throw std::runtime_error(std::string("Fp8Linear '") + layer.config().prefix + "' has no '" + scaleName(kind)
                                 + "' after materialization");
    }
    return LayoutNormalizer::normalize_scale(*scale).tensor;
}

void validateActivation(const Fp8Linear &layer, const Tensor &activation) {
    if (!activation) {
        throw std::runtime_error("Fp8Linear '" + layer.config().prefix + "' got an undefined input");
    }
    const Size k = layer.config().in_features;
    if (activation->ndim() == 0 || activation->shape().back() != k) {
        Shape expected = activation->shape();
        if (expected.empty()) {
            expected.push_back(k);
        } else {
            expected.back() = k;
        }
        throw ShapeMismatch("input", expected, activation->shape());
    }
    if (!isFloatingPoint(activation->dtype()) || activation->dtype() == DataType::F8) {
        throw Error("Fp8Linear '" + layer.config().prefix + "' expects a wide floating input, got "
                    + toString(activation->dtype()));
    }
    if (activation->device() != layer.device()) {
        throw Error("Fp8Linear '" + layer.config().prefix + "' lives on " + layer.device().toString()
                    + " but the input is on " + activation->device().toString());
    }
}

template <typename Op>
void requireKernel(const char *name, const quantization::QuantVariant &variant, const Device &device) {
    if (!Op::dispatcher().supports(device.getType())) {
        throw UnsupportedVariant(quantization::toString(variant), device,
                                 std::string("no ") + name + " kernel registered");
    }
}

} // namespace

void MatMulDispatcher::check_kernels(const quantization::QuantVariant &variant, const Device &device) {
    struct Visitor {
        const quantization::QuantVariant &variant;
        const Device &device;
        void operator()(const quantization::StandardVariant &) const {
            requireKernel<op::StaticScaledFp8Quant>("static_scaled_fp8_quant", variant, device);
            requireKernel<op::PerTokenGroupQuantFp8>("per_token_group_quant_fp8", variant, device);
            requireKernel<op::ScaledMMFp8>("scaled_mm_fp8", variant, device);
        }
        void operator()(const quantization::BlockVariant &) const {
            requireKernel<op::PerTokenGroupQuantFp8>("per_token_group_quant_fp8", variant, device);
            requireKernel<op::BlockScaledMMFp8>("block_scaled_mm_fp8", variant, device);
        }
        void operator()(const quantization::PackedVariant &) const {
            requireKernel<op::MarlinRepackFp8>("marlin_repack_fp8", variant, device);
            requireKernel<op::MarlinGemmFp8>("marlin_gemm_fp8", variant, device);
        }
    };
    std::visit(Visitor{variant, device}, variant);
}

Tensor MatMulDispatcher::apply(Fp8Linear &layer, const Tensor &activation) {
    const auto &variant = layer.variant();
    const Device device = layer.device();
    check_kernels(variant, device);

    ScaleMaterializer::ensure_scales(layer);
    validateActivation(layer, activation);

    const auto &config = layer.config();
    const Size n = config.out_features;
    const Size k = config.in_features;

    Tensor x = LayoutNormalizer::normalize_activation(activation).tensor;
    const Size m = x->size(0);
    auto output = Tensor::empty({m, n}, activation->dtype(), device);

    Tensor weight = layer.weight();

    struct Visitor {
        Fp8Linear &layer;
        const Tensor &x;
        const Tensor &weight;
        Tensor &output;
        Size m;
        Size n;
        Size k;

        void operator()(const quantization::StandardVariant &) const {
            Tensor w = LayoutNormalizer::normalize_weight(weight).tensor;
            Tensor w_scale = requireScale(layer, ScaleKind::WEIGHT_SCALE);
            auto x_q = Tensor::empty({m, k}, DataType::F8, x->device());
            Tensor x_scale;
            if (layer.config().static_activation) {
                x_scale = requireScale(layer, ScaleKind::INPUT_SCALE);
                op::static_scaled_fp8_quant_(x_q, x, x_scale);
            } else {
                x_scale = Tensor::empty({m, 1}, DataType::F32, x->device());
                op::per_token_group_quant_fp8_(x_q, x_scale, x, k);
            }
            op::scaled_mm_fp8_(output, x_q, x_scale, w, w_scale);
        }

        void operator()(const quantization::BlockVariant &v) const {
            Tensor w = LayoutNormalizer::normalize_weight(weight).tensor;
            Tensor w_scale = requireScale(layer, ScaleKind::WEIGHT_SCALE_INV);
            auto x_q = Tensor::empty({m, k}, DataType::F8, x->device());
            auto x_scale = Tensor::empty({m, (k + v.block_k - 1) / v.block_k}, DataType::F32, x->device());
            op::per_token_group_quant_fp8_(x_q, x_scale, x, v.block_k);
            op::block_scaled_mm_fp8_(output, x_q, x_scale, w, w_scale, v.block_n, v.block_k);
        }

        void operator()(const quantization::PackedVariant &) const {
            Tensor w_scale = requireScale(layer, ScaleKind::WEIGHT_SCALE);
            op::marlin_gemm_fp8_(output, x, weight, w_scale, n, k);
        }
    };
    std::visit(Visitor{layer, x, weight, output, m, n, k}, variant);

    if (auto bias = layer.bias()) {
        auto bias_view = (*bias)->as_strided({m, n}, {0, (*bias)->stride(0)});
        op::add_(output, output, bias_view);
    }

    Shape output_shape = activation->shape();
    output_shape.back() = n;
    SPDLOG_TRACE("Fp8Linear '{}' {} -> {}", config.prefix, shapeToString(activation->shape()), shapeToString(output_shape));
    return output->view(output_shape);
}

} // namespace fp8core::nn
