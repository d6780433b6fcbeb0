// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <vector>

#include "pointcloud_dataset/common/DatasetErrors.hpp"
#include "pointcloud_dataset/core/FeatureTransformer.hpp"

using namespace pointcloud_dataset;

namespace {

PointArray makeColumnsArray(std::size_t rows, std::size_t cols) {
    PointArray points(rows, cols);
    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < cols; ++c) {
            points.at(r, c) = static_cast<float>(c) + 0.01f * static_cast<float>(r);
        }
    }
    return points;
}

TransformOptions bareOptions() {
    TransformOptions options;
    options.append_positional_channel = false;
    options.normalize = false;
    options.include_normals = true;
    return options;
}

}  // namespace

TEST(FeatureTransformerTest, OmissionThenCategoricalWidths) {
    TransformOptions options = bareOptions();
    options.omit_parameter_ranges = {3, 6};
    options.categorical_indexes = {2};
    options.categorical_sizes = {4};
    FeatureTransformer transformer(options);

    EXPECT_EQ(6u, transformer.decodedWidth(9));
    EXPECT_EQ(9u, transformer.outputWidth(6));

    PointArray points(4, 9, 0.0f);
    for (std::size_t r = 0; r < points.rows; ++r) {
        points.at(r, 2) = static_cast<float>(r % 4);
    }
    transformer.applyDecodeSteps(points);
    EXPECT_EQ(6u, points.cols);
    transformer.applySampleSteps(points);
    EXPECT_EQ(9u, points.cols);
}

TEST(FeatureTransformerTest, PositionalChannelAddsOneAfterExpansion) {
    TransformOptions options = bareOptions();
    options.omit_parameter_ranges = {3, 6};
    options.categorical_indexes = {2};
    options.categorical_sizes = {4};
    options.append_positional_channel = true;
    FeatureTransformer transformer(options);

    EXPECT_EQ(10u, transformer.outputWidth(transformer.decodedWidth(9)));
}

TEST(FeatureTransformerTest, OmittedColumnsReassembleToOriginalOrder) {
    PointArray original = makeColumnsArray(5, 12);

    TransformOptions options = bareOptions();
    options.omit_parameter_ranges = {8, 10, 2, 4};
    FeatureTransformer transformer(options);

    PointArray kept = original;
    transformer.applyDecodeSteps(kept);
    ASSERT_EQ(8u, kept.cols);

    // Put the omitted ranges back in ascending start order
    PointArray rebuilt(original.rows, original.cols);
    for (std::size_t r = 0; r < original.rows; ++r) {
        std::size_t src = 0;
        for (std::size_t c = 0; c < original.cols; ++c) {
            const bool omitted = (c >= 2 && c < 4) || (c >= 8 && c < 10);
            rebuilt.at(r, c) = omitted ? original.at(r, c) : kept.at(r, src++);
        }
    }
    EXPECT_EQ(original.values, rebuilt.values);
}

TEST(FeatureTransformerTest, DecodeStepsRunHighestStartFirst) {
    TransformOptions options = bareOptions();
    options.omit_parameter_ranges = {6, 9, 3, 4};
    FeatureTransformer transformer(options);

    ASSERT_EQ(2u, transformer.decodeSteps().size());
    EXPECT_EQ(6u, transformer.decodeSteps()[0].first);
    EXPECT_EQ(3u, transformer.decodeSteps()[1].first);

    TransformOptions ascending = bareOptions();
    ascending.omit_parameter_ranges = {3, 4, 6, 9};
    FeatureTransformer ascending_transformer(ascending);
    ASSERT_EQ(2u, ascending_transformer.decodeSteps().size());
    EXPECT_EQ(6u, ascending_transformer.decodeSteps()[0].first);
    EXPECT_EQ(3u, ascending_transformer.decodeSteps()[1].first);
}

TEST(FeatureTransformerTest, OmissionKeepsSameColumnsForEitherPairOrder) {
    const PointArray original = makeColumnsArray(3, 12);

    TransformOptions descending = bareOptions();
    descending.omit_parameter_ranges = {8, 10, 2, 4};
    TransformOptions ascending = bareOptions();
    ascending.omit_parameter_ranges = {2, 4, 8, 10};

    PointArray from_descending = original;
    FeatureTransformer(descending).applyDecodeSteps(from_descending);
    PointArray from_ascending = original;
    FeatureTransformer(ascending).applyDecodeSteps(from_ascending);

    ASSERT_EQ(8u, from_descending.cols);
    EXPECT_EQ(from_ascending.values, from_descending.values);

    const std::vector<std::size_t> expected_columns = {0, 1, 4, 5, 6, 7, 10, 11};
    for (std::size_t r = 0; r < original.rows; ++r) {
        for (std::size_t c = 0; c < expected_columns.size(); ++c) {
            EXPECT_FLOAT_EQ(original.at(r, expected_columns[c]), from_descending.at(r, c));
        }
    }
}

TEST(FeatureTransformerTest, OverlappingOmissionRangesThrowAtConstruction) {
    TransformOptions options = bareOptions();
    options.omit_parameter_ranges = {4, 8, 2, 6};
    EXPECT_THROW(FeatureTransformer transformer(options), ConfigError);
}

TEST(FeatureTransformerTest, NonFiniteCategoricalValueThrows) {
    TransformOptions options = bareOptions();
    options.categorical_indexes = {1};
    options.categorical_sizes = {3};
    FeatureTransformer transformer(options);

    PointArray nan_points(2, 4, 0.0f);
    nan_points.at(1, 1) = std::nanf("");
    EXPECT_THROW(transformer.applySampleSteps(nan_points), SampleError);

    PointArray huge_points(2, 4, 0.0f);
    huge_points.at(0, 1) = 1.0e30f;
    EXPECT_THROW(transformer.applySampleSteps(huge_points), SampleError);

    PointArray negative_points(2, 4, 0.0f);
    negative_points.at(0, 1) = -0.5f;
    EXPECT_THROW(transformer.applySampleSteps(negative_points), SampleError);
}

TEST(FeatureTransformerTest, EmptyOmissionIsNoOp) {
    FeatureTransformer transformer(bareOptions());
    PointArray points = makeColumnsArray(3, 6);
    PointArray copy = points;
    transformer.applyDecodeSteps(points);
    EXPECT_EQ(copy.values, points.values);
    EXPECT_EQ(6u, points.cols);
}

TEST(FeatureTransformerTest, OddOmissionListThrowsAtConstruction) {
    TransformOptions options = bareOptions();
    options.omit_parameter_ranges = {3, 6, 7};
    EXPECT_THROW(FeatureTransformer transformer(options), ConfigError);
}

TEST(FeatureTransformerTest, MismatchedCategoricalListsThrow) {
    TransformOptions options = bareOptions();
    options.categorical_indexes = {1, 2};
    options.categorical_sizes = {3};
    EXPECT_THROW(FeatureTransformer transformer(options), ConfigError);
}

TEST(FeatureTransformerTest, OmissionBeyondWidthThrows) {
    TransformOptions options = bareOptions();
    options.omit_parameter_ranges = {4, 12};
    FeatureTransformer transformer(options);

    PointArray points = makeColumnsArray(2, 6);
    EXPECT_THROW(transformer.applyDecodeSteps(points), SampleError);
}

TEST(FeatureTransformerTest, ExpandCategoricalWritesOneHot) {
    PointArray points(2, 3);
    points.values = {1.f, 2.f, 9.f,
                     3.f, 0.f, 8.f};

    expandCategorical(points, 1, 3);

    ASSERT_EQ(5u, points.cols);
    std::vector<float> expected = {1.f, 0.f, 0.f, 1.f, 9.f,
                                   3.f, 1.f, 0.f, 0.f, 8.f};
    EXPECT_EQ(expected, points.values);
}

TEST(FeatureTransformerTest, ExpandCategoricalRejectsOutOfRangeValue) {
    PointArray points(1, 3);
    points.values = {0.f, 5.f, 0.f};
    EXPECT_THROW(expandCategorical(points, 1, 3), SampleError);
}

TEST(FeatureTransformerTest, PositionalChannelIsRankOverCount) {
    PointArray points(4, 3, 7.0f);
    appendPositionalChannel(points);

    ASSERT_EQ(4u, points.cols);
    EXPECT_FLOAT_EQ(0.0f, points.at(0, 3));
    EXPECT_FLOAT_EQ(0.25f, points.at(1, 3));
    EXPECT_FLOAT_EQ(0.5f, points.at(2, 3));
    EXPECT_FLOAT_EQ(0.75f, points.at(3, 3));
    EXPECT_FLOAT_EQ(7.0f, points.at(3, 2));
}

TEST(FeatureTransformerTest, NormalizeFitsUnitSphereAndKeepsOtherChannels) {
    PointArray points(3, 4);
    points.values = {2.f, 0.f, 0.f, 5.f,
                     4.f, 0.f, 0.f, 6.f,
                     6.f, 0.f, 0.f, 7.f};

    normalizeToUnitSphere(points);

    EXPECT_FLOAT_EQ(-1.0f, points.at(0, 0));
    EXPECT_FLOAT_EQ(0.0f, points.at(1, 0));
    EXPECT_FLOAT_EQ(1.0f, points.at(2, 0));
    EXPECT_FLOAT_EQ(5.0f, points.at(0, 3));
    EXPECT_FLOAT_EQ(7.0f, points.at(2, 3));

    double max_norm = 0.0;
    for (std::size_t r = 0; r < points.rows; ++r) {
        double sq = 0.0;
        for (std::size_t c = 0; c < 3; ++c) {
            sq += points.at(r, c) * points.at(r, c);
        }
        max_norm = std::max(max_norm, std::sqrt(sq));
    }
    EXPECT_NEAR(1.0, max_norm, 1e-6);
}

TEST(FeatureTransformerTest, NormalizeCentersCoincidentPoints) {
    PointArray points(3, 3, 2.5f);
    normalizeToUnitSphere(points);
    for (float value : points.values) {
        EXPECT_FLOAT_EQ(0.0f, value);
    }
}

TEST(FeatureTransformerTest, DisabledNormalsKeepOnlyXyzLast) {
    TransformOptions options = bareOptions();
    options.include_normals = false;
    options.append_positional_channel = true;
    FeatureTransformer transformer(options);

    ASSERT_FALSE(transformer.sampleSteps().empty());
    EXPECT_EQ(StepKind::KeepXyz, transformer.sampleSteps().back().kind);
    EXPECT_EQ(3u, transformer.outputWidth(6));

    PointArray points = makeColumnsArray(4, 6);
    transformer.applySampleSteps(points);
    EXPECT_EQ(3u, points.cols);
    EXPECT_FLOAT_EQ(2.0f, points.at(0, 2));
}

TEST(FeatureTransformerTest, DescribesEachStep) {
    TransformOptions options;
    options.omit_parameter_ranges = {3, 6};
    options.categorical_indexes = {2};
    options.categorical_sizes = {4};
    FeatureTransformer transformer(options);

    EXPECT_EQ("omit[3, 6)", transformer.decodeSteps()[0].describe());
    ASSERT_EQ(3u, transformer.sampleSteps().size());
    EXPECT_EQ("one_hot(column=2, width=4)", transformer.sampleSteps()[0].describe());
    EXPECT_EQ("append_position", transformer.sampleSteps()[1].describe());
    EXPECT_EQ("normalize_xyz", transformer.sampleSteps()[2].describe());
}
