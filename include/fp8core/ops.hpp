#pragma once

#include "ops/add.hpp"
#include "ops/block_scaled_mm_fp8.hpp"
#include "ops/marlin_fp8.hpp"
#include "ops/quant_fp8.hpp"
#include "ops/rearrange.hpp"
#include "ops/scaled_mm_fp8.hpp"
