#include "test_concurrency.h"
#include "test_fp8_kernels.h"
#include "test_layout_normalizer.h"
#include "test_matmul_dispatcher.h"
#include "test_quantization_config.h"
#include "test_scale_materializer.h"
#include "test_variant_resolver.h"

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <functional>
#include <iostream>
#include <map>
#include <memory>

using namespace fp8core::test;

namespace {

using SuiteFactory = std::function<std::unique_ptr<TestFramework>()>;

const std::map<std::string, SuiteFactory> &suites() {
    static const std::map<std::string, SuiteFactory> table{
        {"resolver", []() { return std::make_unique<VariantResolverTest>(); }},
        {"materializer", []() { return std::make_unique<ScaleMaterializerTest>(); }},
        {"normalizer", []() { return std::make_unique<LayoutNormalizerTest>(); }},
        {"dispatcher", []() { return std::make_unique<MatMulDispatcherTest>(); }},
        {"concurrency", []() { return std::make_unique<ConcurrencyTest>(); }},
        {"config", []() { return std::make_unique<QuantizationConfigTest>(); }},
        {"kernels", []() { return std::make_unique<Fp8KernelTest>(); }},
    };
    return table;
}

void printUsage(const char *program) {
    std::cout << "Usage: " << program << " [suite]\n"
              << "Suites:";
    for (const auto &[name, factory] : suites()) {
        std::cout << " " << name;
    }
    std::cout << "\nWithout a suite every suite runs. Set SPDLOG_LEVEL=debug for details." << std::endl;
}

} // namespace

int main(int argc, char **argv) {
    spdlog::cfg::load_env_levels();

    std::vector<std::string> selected;
    if (argc > 1) {
        std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (suites().count(arg) == 0) {
            std::cerr << "Unknown suite '" << arg << "'" << std::endl;
            printUsage(argv[0]);
            return 2;
        }
        selected.push_back(arg);
    } else {
        for (const auto &[name, factory] : suites()) {
            selected.push_back(name);
        }
    }

    std::cout << "==============================================\n"
              << "fp8core Test Suite\n"
              << "==============================================" << std::endl;

    int failed = 0;
    for (const auto &name : selected) {
        auto suite = suites().at(name)();
        auto result = suite->run();
        if (result.passed) {
            spdlog::info("Suite {} passed ({} us)", suite->getName(), result.duration.count());
        } else {
            spdlog::error("Suite {} failed: {}", suite->getName(), result.error_message);
            ++failed;
        }
    }

    std::cout << "==============================================\n"
              << (selected.size() - failed) << "/" << selected.size() << " suites passed\n"
              << "==============================================" << std::endl;
    return failed == 0 ? 0 : 1;
}
