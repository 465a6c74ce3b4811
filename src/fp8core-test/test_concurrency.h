#ifndef __FP8CORE_TEST_CONCURRENCY_H__
#define __FP8CORE_TEST_CONCURRENCY_H__

#include "fp8core/nn/fp8_linear.hpp"
#include "test_runner.h"

namespace fp8core::test {

class ConcurrencyTest : public TestFramework {
public:
    TestResult run() override;
    std::string getName() const override { return "ConcurrencyTest"; }

private:
    TestResult testConcurrentFirstForward();
    TestResult testEagerAndLazyRace();
    TestResult testConcurrentVariantResolution();
    TestResult testManyForwardsOnFrozenLayer();
    TestResult testForwardWhileOtherLayerMaterializes();

    static void loadFrozenParameters(nn::Fp8Linear &layer);
};

} // namespace fp8core::test

#endif // __FP8CORE_TEST_CONCURRENCY_H__
