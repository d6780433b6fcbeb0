// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "pointcloud_dataset/common/DatasetErrors.hpp"
#include "pointcloud_dataset/core/PointResampler.hpp"

using pointcloud_dataset::PointArray;
using pointcloud_dataset::PointResampler;
using pointcloud_dataset::ResampleError;

TEST(PointResamplerTest, DownsamplingNeverDuplicatesIndices) {
    std::mt19937 rng(7);
    for (int trial = 0; trial < 50; ++trial) {
        auto indices = PointResampler::drawIndices(100, 32, rng);
        ASSERT_EQ(32u, indices.size());
        std::set<std::size_t> unique(indices.begin(), indices.end());
        EXPECT_EQ(indices.size(), unique.size());
        EXPECT_TRUE(std::is_sorted(indices.begin(), indices.end()));
        EXPECT_LT(indices.back(), 100u);
    }
}

TEST(PointResamplerTest, UpsamplingKeepsAscendingOrder) {
    std::mt19937 rng(11);
    auto indices = PointResampler::drawIndices(3, 16, rng);

    ASSERT_EQ(16u, indices.size());
    EXPECT_TRUE(std::is_sorted(indices.begin(), indices.end()));
    for (std::size_t index : indices) {
        EXPECT_LT(index, 3u);
    }
}

TEST(PointResamplerTest, EqualCountDrawsWithReplacement) {
    std::mt19937 rng(3);
    auto indices = PointResampler::drawIndices(5, 5, rng);
    EXPECT_EQ(5u, indices.size());
    EXPECT_TRUE(std::is_sorted(indices.begin(), indices.end()));
}

TEST(PointResamplerTest, EmptyInputThrows) {
    std::mt19937 rng(1);
    PointArray empty(0, 6);
    EXPECT_THROW(PointResampler::drawIndices(0, 8, rng), ResampleError);
    EXPECT_THROW(PointResampler::resample(empty, 8, rng), ResampleError);
}

TEST(PointResamplerTest, ResampleKeepsRowsIntact) {
    PointArray points(10, 4);
    for (std::size_t r = 0; r < points.rows; ++r) {
        for (std::size_t c = 0; c < points.cols; ++c) {
            points.at(r, c) = static_cast<float>(r * 10 + c);
        }
    }

    std::mt19937 rng(5);
    PointArray out = PointResampler::resample(points, 6, rng);

    ASSERT_EQ(6u, out.rows);
    ASSERT_EQ(4u, out.cols);
    float previous = -1.0f;
    for (std::size_t r = 0; r < out.rows; ++r) {
        const float base = out.at(r, 0);
        EXPECT_GT(base, previous);
        previous = base;
        for (std::size_t c = 1; c < out.cols; ++c) {
            EXPECT_FLOAT_EQ(base + static_cast<float>(c), out.at(r, c));
        }
    }
}

TEST(PointResamplerTest, GatherCopiesSelectedRows) {
    PointArray points(3, 2);
    points.values = {0.f, 1.f, 10.f, 11.f, 20.f, 21.f};

    PointArray out = PointResampler::gather(points, {2, 2, 0});
    std::vector<float> expected = {20.f, 21.f, 20.f, 21.f, 0.f, 1.f};
    EXPECT_EQ(expected, out.values);
}
