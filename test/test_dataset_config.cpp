// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include <yaml-cpp/yaml.h>

#include "pointcloud_dataset/config/DatasetConfig.hpp"

using pointcloud_dataset::DatasetOptions;
using pointcloud_dataset::Split;
using pointcloud_dataset::config::DatasetConfig;
using pointcloud_dataset::config::loadDatasetConfigFromYaml;
using pointcloud_dataset::config::optionsFromConfig;

namespace {

std::string writeTempYaml(const std::string& contents) {
    auto temp_dir = std::filesystem::temp_directory_path();
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    auto path = temp_dir / std::filesystem::path(std::string("pcd_dataset_config_") + info->name() + ".yaml");
    std::ofstream ofs(path);
    ofs << contents;
    ofs.close();
    return path.string();
}

}  // namespace

TEST(DatasetConfigTest, LoadsValuesFromYaml) {
    const std::string yaml = R"(
pointcloud_dataset:
  dataset:
    root: "/data/modelnet"
    batch_size: 16
    num_points: 2048
    normalize: false
    include_normals: false
    cache_size: 100
    shuffle_points: true
    scale_low: 0.8
    scale_high: 1.25
    shift_range: 0.1
    jitter_sigma: 0.01
    jitter_clip: 0.05
    append_positional_channel: false
    omit_parameter_ranges: [6, 9, 3, 4]
    categorical_indexes: [2]
    categorical_sizes: [5]
    seed: 17
    verbose: true
  train:
    batch_size: 8
    augment: false
  test:
    shuffle: true
    shuffle_points: false
  export:
    output_file: "/tmp/epoch.h5"
    split: "test"
)";

    const auto path = writeTempYaml(yaml);
    DatasetConfig config = loadDatasetConfigFromYaml(path);

    EXPECT_EQ("/data/modelnet", config.root);
    EXPECT_EQ(16, config.batch_size);
    EXPECT_EQ(2048, config.num_points);
    EXPECT_FALSE(config.normalize);
    EXPECT_FALSE(config.include_normals);
    EXPECT_EQ(100, config.cache_size);
    EXPECT_TRUE(config.shuffle_points);
    EXPECT_DOUBLE_EQ(0.8, config.scale_low);
    EXPECT_DOUBLE_EQ(1.25, config.scale_high);
    EXPECT_DOUBLE_EQ(0.1, config.shift_range);
    EXPECT_DOUBLE_EQ(0.01, config.jitter_sigma);
    EXPECT_DOUBLE_EQ(0.05, config.jitter_clip);
    EXPECT_FALSE(config.append_positional_channel);
    EXPECT_EQ((std::vector<int>{6, 9, 3, 4}), config.omit_parameter_ranges);
    EXPECT_EQ((std::vector<int>{2}), config.categorical_indexes);
    EXPECT_EQ((std::vector<int>{5}), config.categorical_sizes);
    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(17u, *config.seed);
    EXPECT_TRUE(config.verbose);

    EXPECT_EQ(8, config.train.batch_size.value_or(0));
    EXPECT_FALSE(config.train.augment);
    EXPECT_TRUE(config.test.shuffle.value_or(false));
    EXPECT_EQ("/tmp/epoch.h5", config.export_file);
    EXPECT_EQ("test", config.export_split);

    EXPECT_TRUE(config.validate(false).empty());
}

TEST(DatasetConfigTest, AppliesDefaultsForMissingEntries) {
    const auto path = writeTempYaml("root: \"/data/shapes\"\n");
    DatasetConfig config = loadDatasetConfigFromYaml(path);

    EXPECT_EQ("/data/shapes", config.root);
    EXPECT_EQ(32, config.batch_size);
    EXPECT_EQ(1024, config.num_points);
    EXPECT_TRUE(config.normalize);
    EXPECT_TRUE(config.include_normals);
    EXPECT_EQ(15000, config.cache_size);
    EXPECT_FALSE(config.shuffle_points);
    EXPECT_DOUBLE_EQ(0.7, config.scale_low);
    EXPECT_DOUBLE_EQ(1.3, config.scale_high);
    EXPECT_DOUBLE_EQ(0.3, config.shift_range);
    EXPECT_DOUBLE_EQ(0.005, config.jitter_sigma);
    EXPECT_TRUE(config.append_positional_channel);
    EXPECT_TRUE(config.omit_parameter_ranges.empty());
    EXPECT_FALSE(config.seed.has_value());
    EXPECT_TRUE(config.train.augment);
    EXPECT_FALSE(config.test.augment);
    EXPECT_EQ("train", config.export_split);
}

TEST(DatasetConfigTest, OptionsFollowSplitOverrides) {
    DatasetConfig config;
    config.root = "/data";
    config.batch_size = 32;
    config.shuffle_points = true;
    config.train.batch_size = 4;
    config.test.shuffle_points = false;

    DatasetOptions train = optionsFromConfig(config, Split::Train);
    DatasetOptions test = optionsFromConfig(config, Split::Test);

    EXPECT_EQ(Split::Train, train.split);
    EXPECT_EQ(4u, train.batch_size);
    EXPECT_TRUE(train.shuffle_points);
    EXPECT_TRUE(train.shuffleEnabled());

    EXPECT_EQ(Split::Test, test.split);
    EXPECT_EQ(32u, test.batch_size);
    EXPECT_FALSE(test.shuffle_points);
    EXPECT_FALSE(test.shuffleEnabled());
}

TEST(DatasetConfigTest, ValidateReportsProblems) {
    DatasetConfig config;
    config.batch_size = 0;
    config.num_points = -1;
    config.omit_parameter_ranges = {1, 2, 3};
    config.categorical_indexes = {1};
    config.scale_low = 2.0;
    config.export_split = "validation";

    auto errors = config.validate(false);
    auto contains = [&errors](const std::string& needle) {
        for (const auto& error : errors) {
            if (error.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    };

    EXPECT_TRUE(contains("root"));
    EXPECT_TRUE(contains("batch_size"));
    EXPECT_TRUE(contains("num_points"));
    EXPECT_TRUE(contains("omit_parameter_ranges"));
    EXPECT_TRUE(contains("categorical"));
    EXPECT_TRUE(contains("scale_low"));
    EXPECT_TRUE(contains("export split"));
}

TEST(DatasetConfigTest, ValidateChecksRootDirectory) {
    DatasetConfig config;
    config.root = "/nonexistent/pointcloud_dataset_root";
    auto errors = config.validate(true);
    ASSERT_EQ(1u, errors.size());
    EXPECT_NE(std::string::npos, errors[0].find("not a directory"));
    EXPECT_TRUE(config.validate(false).empty());
}

TEST(DatasetConfigTest, MissingFileThrows) {
    EXPECT_THROW(loadDatasetConfigFromYaml("/nonexistent/config.yaml"), YAML::BadFile);
}
