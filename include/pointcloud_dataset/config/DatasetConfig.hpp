// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_CONFIG_DATASET_CONFIG_HPP
#define POINTCLOUD_DATASET_CONFIG_DATASET_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pointcloud_dataset/core/ClassCatalog.hpp"
#include "pointcloud_dataset/core/PointCloudDataset.hpp"

namespace pointcloud_dataset::config {

struct SplitConfig {
    std::optional<bool> shuffle;
    std::optional<int> batch_size;
    std::optional<bool> shuffle_points;
    bool augment = false;
};

struct DatasetConfig {
    std::string root;
    int batch_size = 32;
    int num_points = 1024;
    bool normalize = true;
    bool include_normals = true;
    int cache_size = 15000;
    bool shuffle_points = false;
    double scale_low = 0.7;
    double scale_high = 1.3;
    double shift_range = 0.3;
    double jitter_sigma = 0.005;
    double jitter_clip = 0.1;
    bool append_positional_channel = true;
    std::vector<int> omit_parameter_ranges;
    std::vector<int> categorical_indexes;
    std::vector<int> categorical_sizes;
    std::optional<uint32_t> seed;
    bool verbose = false;

    SplitConfig train{std::nullopt, std::nullopt, std::nullopt, true};
    SplitConfig test;

    std::string export_file;
    std::string export_split = "train";

    std::vector<std::string> validate(bool check_filesystem = true) const;

    const SplitConfig& splitConfig(Split split) const {
        return split == Split::Train ? train : test;
    }
};

DatasetConfig loadDatasetConfigFromYaml(const std::string& path);

DatasetOptions optionsFromConfig(const DatasetConfig& config, Split split);

}  // namespace pointcloud_dataset::config

#endif  // POINTCLOUD_DATASET_CONFIG_DATASET_CONFIG_HPP
