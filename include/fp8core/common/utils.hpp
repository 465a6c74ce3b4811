#pragma once

#include "../error.hpp"
#include "../tensor.hpp"

#include <string>

#define FP8CORE_ASSERT_TENSORS_SAME_DEVICE(FIRST___, ...)                                  \
    do {                                                                                   \
        for (const auto &tensor___ : {__VA_ARGS__}) {                                      \
            if (FIRST___->device() != tensor___->device()) {                               \
                throw std::runtime_error("Tensor devices mismatch " + FIRST___->device().toString() \
                                         + " vs " + tensor___->device().toString()        \
                                         + " from " + __func__);                           \
            }                                                                              \
        }                                                                                  \
    } while (0)

#define FP8CORE_KERNEL_CHECK(CONDITION___, KERNEL___, MESSAGE___) \
    do {                                                          \
        if (!(CONDITION___)) {                                    \
            throw ::fp8core::KernelFailure(KERNEL___, MESSAGE___); \
        }                                                         \
    } while (0)
