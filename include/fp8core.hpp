#pragma once

#include "fp8core/context/context.hpp"
#include "fp8core/device.hpp"
#include "fp8core/dtype.hpp"
#include "fp8core/error.hpp"
#include "fp8core/nn/fp8_linear.hpp"
#include "fp8core/nn/layout_normalizer.hpp"
#include "fp8core/nn/matmul_dispatcher.hpp"
#include "fp8core/nn/scale_materializer.hpp"
#include "fp8core/ops.hpp"
#include "fp8core/quantization/fp8.hpp"
#include "fp8core/quantization/variant_resolver.hpp"
#include "fp8core/tensor.hpp"
