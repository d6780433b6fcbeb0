// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include "DatasetFixture.hpp"
#include "pointcloud_dataset/report/DatasetSummary.hpp"

using namespace pointcloud_dataset;
using pointcloud_dataset::testing_support::DatasetTreeTest;
using pointcloud_dataset::testing_support::writeClassSamples;

class DatasetSummaryTest : public DatasetTreeTest {};

TEST_F(DatasetSummaryTest, ListsClassesWeightsAndChannels) {
    writeClassSamples(root, "a.1", "train", 3, 6, 9);
    writeClassSamples(root, "a.2", "train", 1, 6, 9);

    DatasetOptions options;
    options.root = root.string();
    options.batch_size = 2;
    options.num_points = 4;
    options.omit_parameter_ranges = {3, 6};
    options.seed = 5u;
    PointCloudDataset dataset(options);

    const std::string summary = formatDatasetSummary(dataset);

    EXPECT_NE(std::string::npos, summary.find("Dataset summary (train)"));
    EXPECT_NE(std::string::npos, summary.find("Samples          : 4"));
    EXPECT_NE(std::string::npos, summary.find("Classes          : 2"));
    EXPECT_NE(std::string::npos, summary.find("Channels         : 7"));
    EXPECT_NE(std::string::npos, summary.find("2 batches per epoch"));
    EXPECT_NE(std::string::npos, summary.find("omit[3, 6)"));
    EXPECT_NE(std::string::npos, summary.find("a.1"));
    EXPECT_NE(std::string::npos, summary.find("weight=0.500000"));
    EXPECT_NE(std::string::npos, summary.find("weight=1.500000"));
    EXPECT_NE(std::string::npos, summary.find("Decoded width    : 6 channels"));
    EXPECT_NE(std::string::npos, summary.find("Output width     : 7 channels"));
}

TEST(TransformPlanTest, TracksWidthThroughEachStep) {
    TransformOptions options;
    options.categorical_indexes = {2};
    options.categorical_sizes = {4};
    options.include_normals = true;
    FeatureTransformer transformer(options);

    const std::string plan = formatTransformPlan(transformer, 6);
    EXPECT_NE(std::string::npos, plan.find("6 -> 9"));
    EXPECT_NE(std::string::npos, plan.find("9 -> 10"));
    EXPECT_NE(std::string::npos, plan.find("Output width     : 10 channels"));
}
