#include "test_layout_normalizer.h"

#include <numeric>

namespace fp8core::test {

using nn::LayoutNormalizer;

namespace {

std::vector<float> iota(size_t n) {
    std::vector<float> values(n);
    std::iota(values.begin(), values.end(), 0.0f);
    return values;
}

} // namespace

TestResult LayoutNormalizerTest::testContiguousActivationIsView() {
    return measureTime("ContiguousActivationIsView", [this]() {
        auto x = makeTensor(iota(48), {2, 3, 8});
        auto view = LayoutNormalizer::normalize_activation(x);

        if (view.copied || view.tensor->shape() != Shape({6, 8}) || view.tensor->data() != x->data()) {
            SPDLOG_ERROR("Contiguous [2, 3, 8] should flatten to a [6, 8] view, got {}", view.tensor->info());
            return false;
        }
        if (view.tensor->stride(1) != 1) {
            SPDLOG_ERROR("Inner axis must have stride 1");
            return false;
        }
        if (!allClose(toFloats(view.tensor), toFloats(x), 0.0, 0.0)) {
            SPDLOG_ERROR("Flattening changed values");
            return false;
        }

        SPDLOG_INFO("✓ Contiguous activation view passed");
        return true;
    });
}

TestResult LayoutNormalizerTest::testPaddedRowsAreView() {
    return measureTime("PaddedRowsAreView", [this]() {
        // Rows of 8 valid values inside 16-wide storage: the leading dims still
        // fold into one axis with row stride 16.
        auto storage = makeTensor(iota(96), {2, 3, 16});
        auto x = storage->narrow({{2, 0, 8}});
        auto view = LayoutNormalizer::normalize_activation(x);

        if (view.copied) {
            SPDLOG_ERROR("Padded rows should not force a copy");
            return false;
        }
        if (view.tensor->shape() != Shape({6, 8}) || view.tensor->stride(0) != 16 || view.tensor->stride(1) != 1) {
            SPDLOG_ERROR("Unexpected view {}", view.tensor->info());
            return false;
        }
        if (!allClose(toFloats(view.tensor), toFloats(x), 0.0, 0.0)) {
            SPDLOG_ERROR("Padded view changed values");
            return false;
        }

        SPDLOG_INFO("✓ Padded rows view passed");
        return true;
    });
}

TestResult LayoutNormalizerTest::testStridedActivationIsCopied() {
    return measureTime("StridedActivationIsCopied", [this]() {
        // Transposed storage: inner axis has stride 6.
        auto storage = makeTensor(iota(48), {8, 6});
        auto transposed = storage->permute({1, 0});
        auto view = LayoutNormalizer::normalize_activation(transposed);
        if (!view.copied || !view.tensor->is_contiguous() || view.tensor->shape() != Shape({6, 8})) {
            SPDLOG_ERROR("Transposed activation should be compacted, got {}", view.tensor->info());
            return false;
        }
        if (!allClose(toFloats(view.tensor), toFloats(transposed), 0.0, 0.0)) {
            SPDLOG_ERROR("Compacting changed values");
            return false;
        }

        // Leading dims that cannot fold: [2, 3, 8] cut out of [2, 4, 8].
        auto cut = makeTensor(iota(64), {2, 4, 8})->narrow({{1, 0, 3}});
        auto folded = LayoutNormalizer::normalize_activation(cut);
        if (!folded.copied || folded.tensor->shape() != Shape({6, 8})) {
            SPDLOG_ERROR("Non-foldable leading dims should be compacted, got {}", folded.tensor->info());
            return false;
        }
        if (!allClose(toFloats(folded.tensor), toFloats(cut), 0.0, 0.0)) {
            SPDLOG_ERROR("Compacting changed values");
            return false;
        }

        SPDLOG_INFO("✓ Strided activation copy passed");
        return true;
    });
}

TestResult LayoutNormalizerTest::testUnitAxesNeverCopy() {
    return measureTime("UnitAxesNeverCopy", [this]() {
        auto storage = makeTensor(iota(8), {8});
        auto x = storage->as_strided({1, 1, 8}, {1000, 77, 1});
        auto view = LayoutNormalizer::normalize_activation(x);
        if (view.copied || view.tensor->shape() != Shape({1, 8})) {
            SPDLOG_ERROR("Extent-1 leading axes should not force a copy, got {}", view.tensor->info());
            return false;
        }

        auto weight = makeTensor(iota(4), {4}, DataType::F8)->as_strided({4, 1}, {1, 9});
        auto w = LayoutNormalizer::normalize_weight(weight);
        if (w.copied || w.tensor->shape() != Shape({1, 4})) {
            SPDLOG_ERROR("A weight with K == 1 should not force a copy, got {}", w.tensor->info());
            return false;
        }

        SPDLOG_INFO("✓ Unit axes passed");
        return true;
    });
}

TestResult LayoutNormalizerTest::testWeightTranspose() {
    return measureTime("WeightTranspose", [this]() {
        // [N, K] = [4, 8], values exact in F8.
        std::vector<float> values(32);
        for (size_t i = 0; i < values.size(); ++i) {
            values[i] = static_cast<float>(i % 8) - 4.0f;
        }
        auto weight = makeTensor(values, {4, 8}, DataType::F8);
        auto view = LayoutNormalizer::normalize_weight(weight);

        if (view.copied || view.tensor->shape() != Shape({8, 4}) || view.tensor->stride(0) != 1) {
            SPDLOG_ERROR("Row-major weight should transpose as a view, got {}", view.tensor->info());
            return false;
        }
        // Reversible: transposing back gives the original values.
        if (!tensorsAllClose(view.tensor->permute({1, 0}), weight, 0.0, 0.0)) {
            SPDLOG_ERROR("Transposed view does not round-trip");
            return false;
        }

        // A column-major weight has to be compacted first.
        auto col_major = makeTensor(values, {8, 4}, DataType::F8)->permute({1, 0});
        auto copied = LayoutNormalizer::normalize_weight(col_major);
        if (!copied.copied || copied.tensor->stride(0) != 1) {
            SPDLOG_ERROR("Column-major weight should be compacted, got {}", copied.tensor->info());
            return false;
        }
        if (!tensorsAllClose(copied.tensor->permute({1, 0}), col_major, 0.0, 0.0)) {
            SPDLOG_ERROR("Compacted weight changed values");
            return false;
        }

        auto both = LayoutNormalizer::normalize(makeTensor(iota(16), {2, 8}), weight);
        if (both.first.copied || both.second.copied) {
            SPDLOG_ERROR("normalize() should not copy layout-correct operands");
            return false;
        }

        SPDLOG_INFO("✓ Weight transpose passed");
        return true;
    });
}

TestResult LayoutNormalizerTest::testScaleCompaction() {
    return measureTime("ScaleCompaction", [this]() {
        auto scale = makeTensor({1.0f, 2.0f, 3.0f, 4.0f}, {2, 2});
        auto same = LayoutNormalizer::normalize_scale(scale);
        if (same.copied || !same.tensor.is_same(scale)) {
            SPDLOG_ERROR("Contiguous scale should be returned as is");
            return false;
        }

        auto transposed = scale->permute({1, 0});
        auto compact = LayoutNormalizer::normalize_scale(transposed);
        if (!compact.copied || !compact.tensor->is_contiguous()) {
            SPDLOG_ERROR("Transposed scale should be compacted");
            return false;
        }
        if (!allClose(toFloats(compact.tensor), {1.0f, 3.0f, 2.0f, 4.0f}, 0.0, 0.0)) {
            SPDLOG_ERROR("Compacted scale has wrong values");
            return false;
        }

        SPDLOG_INFO("✓ Scale compaction passed");
        return true;
    });
}

TestResult LayoutNormalizerTest::run() {
    std::vector<TestResult> results;
    results.push_back(testContiguousActivationIsView());
    results.push_back(testPaddedRowsAreView());
    results.push_back(testStridedActivationIsCopied());
    results.push_back(testUnitAxesNeverCopy());
    results.push_back(testWeightTranspose());
    results.push_back(testScaleCompaction());
    return combine(results);
}

} // namespace fp8core::test
