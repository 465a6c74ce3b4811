#include "test_quantization_config.h"
#include "fp8core/quantization/variant_resolver.hpp"

namespace fp8core::test {

using quantization::Fp8;
using quantization::HardwareCapability;
using quantization::QuantScheme;

TestResult QuantizationConfigTest::testDynamicPerChannel() {
    return measureTime("DynamicPerChannel", [this]() {
        auto json = nlohmann::json::parse(R"({"quant_method": "fp8", "activation_scheme": "dynamic"})");
        Fp8 fp8(json, HardwareCapability{});

        if (fp8.get_quant_scheme() != QuantScheme::FP8_W8A8 || fp8.is_static_activation() || fp8.use_marlin()) {
            SPDLOG_ERROR("Plain dynamic fp8 config parsed incorrectly");
            return false;
        }
        auto config = fp8.make_layer_config("model.layers.0.self_attn.q_proj", 64, 32, true, DataType::BF16);
        if (config.in_features != 64 || config.out_features != 32 || !config.bias
            || config.params_dtype != DataType::BF16 || !config.per_channel_supported) {
            SPDLOG_ERROR("LayerConfig fields not carried over");
            return false;
        }
        if (quantization::toString(quantization::VariantResolver::resolve(config)) != "Standard(channel)") {
            SPDLOG_ERROR("Expected Standard(channel)");
            return false;
        }

        SPDLOG_INFO("✓ Dynamic per-channel config passed");
        return true;
    });
}

TestResult QuantizationConfigTest::testBlockConfig() {
    return measureTime("BlockConfig", [this]() {
        auto json = nlohmann::json::parse(
            R"({"quant_method": "fp8", "activation_scheme": "dynamic", "weight_block_size": [128, 128]})");
        HardwareCapability capability;
        capability.force_marlin = true;
        Fp8 fp8(json, capability);

        if (fp8.get_quant_scheme() != QuantScheme::FP8_BLOCK_W8A8) {
            SPDLOG_ERROR("Block config should report FP8_BLOCK_W8A8");
            return false;
        }
        if (fp8.use_marlin()) {
            SPDLOG_ERROR("Block quantization must not use the packed kernel");
            return false;
        }
        auto config = fp8.make_layer_config("mlp.down_proj", 512, 256, false);
        if (!config.weight_block_size.has_value() || (*config.weight_block_size)[0] != 128
            || (*config.weight_block_size)[1] != 128) {
            SPDLOG_ERROR("weight_block_size not carried over");
            return false;
        }
        if (quantization::toString(quantization::VariantResolver::resolve(config)) != "Block(128x128)") {
            SPDLOG_ERROR("Expected Block(128x128)");
            return false;
        }

        SPDLOG_INFO("✓ Block config passed");
        return true;
    });
}

TestResult QuantizationConfigTest::testMarlinSelection() {
    return measureTime("MarlinSelection", [this]() {
        auto json = nlohmann::json::parse(R"({"quant_method": "fp8"})");

        HardwareCapability no_fp8;
        no_fp8.fp8_supported = false;
        if (!Fp8(json, no_fp8).use_marlin()) {
            SPDLOG_ERROR("Devices without FP8 GEMM should use the packed kernel");
            return false;
        }

        HardwareCapability forced;
        forced.force_marlin = true;
        auto config = Fp8(json, forced).make_layer_config("lm_head", 32, 32, false);
        if (!config.use_marlin) {
            SPDLOG_ERROR("force_marlin should select the packed kernel");
            return false;
        }

        if (Fp8(json, HardwareCapability{}).use_marlin()) {
            SPDLOG_ERROR("FP8-capable devices should not use the packed kernel by default");
            return false;
        }

        SPDLOG_INFO("✓ Marlin selection passed");
        return true;
    });
}

TestResult QuantizationConfigTest::testIgnoredLayers() {
    return measureTime("IgnoredLayers", [this]() {
        auto json = nlohmann::json::parse(
            R"({"quant_method": "fp8", "ignored_layers": ["lm_head", "model.layers.0.mlp"]})");
        Fp8 fp8(json, HardwareCapability{});

        if (!fp8.is_layer_skipped("lm_head") || !fp8.is_layer_skipped("model.layers.0.mlp.gate_proj")) {
            SPDLOG_ERROR("Ignored layers not reported");
            return false;
        }
        if (fp8.is_layer_skipped("model.layers.0.mlp_extra") || fp8.is_layer_skipped("model.layers.1.mlp")) {
            SPDLOG_ERROR("Only exact names and their children are skipped");
            return false;
        }
        try {
            fp8.make_layer_config("lm_head", 16, 16, false);
            SPDLOG_ERROR("make_layer_config should refuse an ignored layer");
            return false;
        } catch (const std::invalid_argument &e) {
            SPDLOG_DEBUG("Got expected error: {}", e.what());
        }

        SPDLOG_INFO("✓ Ignored layers passed");
        return true;
    });
}

TestResult QuantizationConfigTest::testRejectedConfigs() {
    return measureTime("RejectedConfigs", [this]() {
        const std::vector<std::string> rejected{
            R"({"quant_method": "awq"})",
            R"({"quant_method": "fp8", "activation_scheme": "per_token"})",
            R"({"quant_method": "fp8", "weight_block_size": [128]})",
            R"({"quant_method": "fp8", "activation_scheme": "static", "weight_block_size": [128, 128]})",
        };
        for (const auto &text : rejected) {
            try {
                Fp8 fp8(nlohmann::json::parse(text), HardwareCapability{});
                SPDLOG_ERROR("Config should have been rejected: {}", text);
                return false;
            } catch (const std::runtime_error &e) {
                SPDLOG_DEBUG("Rejected {}: {}", text, e.what());
            }
        }

        auto json = nlohmann::json::parse(R"({"quant_method": "fp8", "activation_scheme": "static"})");
        Fp8 fp8(json, HardwareCapability{});
        if (!fp8.make_layer_config("o_proj", 16, 16, false).static_activation) {
            SPDLOG_ERROR("Static activation scheme not carried over");
            return false;
        }
        if (fp8.get<std::string>("activation_scheme") != "static" || fp8.get_or<int>("bits", 8) != 8) {
            SPDLOG_ERROR("get/get_or returned unexpected values");
            return false;
        }

        SPDLOG_INFO("✓ Rejected configs passed");
        return true;
    });
}

TestResult QuantizationConfigTest::testMakeQuantization() {
    return measureTime("MakeQuantization", [this]() {
        auto quant = quantization::make_quantization(nlohmann::json::parse(R"({"quant_method": "fp8"})"));
        if (dynamic_cast<Fp8 *>(quant.get()) == nullptr) {
            SPDLOG_ERROR("make_quantization should build an Fp8 config");
            return false;
        }
        for (const char *text : {R"({"quant_method": "gptq"})", R"({"bits": 4})"}) {
            try {
                quantization::make_quantization(nlohmann::json::parse(text));
                SPDLOG_ERROR("Expected make_quantization to reject {}", text);
                return false;
            } catch (const std::runtime_error &e) {
                SPDLOG_DEBUG("Got expected error: {}", e.what());
            }
        }

        SPDLOG_INFO("✓ make_quantization passed");
        return true;
    });
}

TestResult QuantizationConfigTest::run() {
    std::vector<TestResult> results;
    results.push_back(testDynamicPerChannel());
    results.push_back(testBlockConfig());
    results.push_back(testMarlinSelection());
    results.push_back(testIgnoredLayers());
    results.push_back(testRejectedConfigs());
    results.push_back(testMakeQuantization());
    return combine(results);
}

} // namespace fp8core::test
