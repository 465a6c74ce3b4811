#ifndef __FP8CORE_TEST_SCALE_MATERIALIZER_H__
#define __FP8CORE_TEST_SCALE_MATERIALIZER_H__

#include "fp8core/nn/scale_materializer.hpp"
#include "test_runner.h"

namespace fp8core::test {

class ScaleMaterializerTest : public TestFramework {
public:
    TestResult run() override;
    std::string getName() const override { return "ScaleMaterializerTest"; }

private:
    TestResult testPlaceholderCreation();
    TestResult testIdempotence();
    TestResult testLoadedScaleKept();
    TestResult testShapeMismatch();
    TestResult testBlockScaleShapes();
    TestResult testStaticInputScale();
    TestResult testNullScale();
    TestResult testNonContiguousScale();
    TestResult testPackedRepack();
    TestResult testDeviceMove();
    TestResult testFrozenAfterMaterialization();
    TestResult testStateDictAllOrNothing();
};

} // namespace fp8core::test

#endif // __FP8CORE_TEST_SCALE_MATERIALIZER_H__
