#pragma once

#include "../dtype.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace fp8core::nn {

struct LayerConfig {
    size_t in_features = 0;
    size_t out_features = 0;
    // The device has a hardware per-channel FP8 GEMM path.
    bool per_channel_supported = false;
    // [block_n, block_k]
    std::optional<std::array<size_t, 2>> weight_block_size;
    bool use_marlin = false;
    // Activation scale comes from the checkpoint (`input_scale`).
    bool static_activation = false;
    bool bias = false;
    // Dtype of the bias and of placeholder scales.
    DataType params_dtype = DataType::F32;
    std::string prefix;
};

} // namespace fp8core::nn
