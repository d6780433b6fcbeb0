// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "pointcloud_dataset/config/DatasetConfig.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>

namespace pointcloud_dataset::config {

namespace {

YAML::Node extractParameterNode(const YAML::Node& root) {
    if (!root || root.IsNull()) {
        return YAML::Node();
    }

    if (root["pointcloud_dataset"]) {
        return root["pointcloud_dataset"];
    }

    return root;
}

template <typename T>
T readOrDefault(const YAML::Node& node, const std::string& key, const T& default_value) {
    if (!node || !node[key]) {
        return default_value;
    }
    return node[key].as<T>();
}

template <typename T>
std::optional<T> readOptional(const YAML::Node& node, const std::string& key) {
    if (!node || !node[key] || node[key].IsNull()) {
        return std::nullopt;
    }
    return node[key].as<T>();
}

SplitConfig parseSplitConfig(const YAML::Node& node, SplitConfig config) {
    if (!node) {
        return config;
    }
    if (auto value = readOptional<bool>(node, "shuffle")) {
        config.shuffle = value;
    }
    if (auto value = readOptional<int>(node, "batch_size")) {
        config.batch_size = value;
    }
    if (auto value = readOptional<bool>(node, "shuffle_points")) {
        config.shuffle_points = value;
    }
    config.augment = readOrDefault<bool>(node, "augment", config.augment);
    return config;
}

DatasetConfig parseDatasetConfig(const YAML::Node& params) {
    DatasetConfig config;
    // Shared parameters live under "dataset:", or directly at the top level.
    const YAML::Node dataset = params["dataset"] ? params["dataset"] : params;

    config.root = readOrDefault<std::string>(dataset, "root", "");
    config.batch_size = readOrDefault<int>(dataset, "batch_size", config.batch_size);
    config.num_points = readOrDefault<int>(dataset, "num_points", config.num_points);
    config.normalize = readOrDefault<bool>(dataset, "normalize", config.normalize);
    config.include_normals = readOrDefault<bool>(dataset, "include_normals", config.include_normals);
    config.cache_size = readOrDefault<int>(dataset, "cache_size", config.cache_size);
    config.shuffle_points = readOrDefault<bool>(dataset, "shuffle_points", config.shuffle_points);
    config.scale_low = readOrDefault<double>(dataset, "scale_low", config.scale_low);
    config.scale_high = readOrDefault<double>(dataset, "scale_high", config.scale_high);
    config.shift_range = readOrDefault<double>(dataset, "shift_range", config.shift_range);
    config.jitter_sigma = readOrDefault<double>(dataset, "jitter_sigma", config.jitter_sigma);
    config.jitter_clip = readOrDefault<double>(dataset, "jitter_clip", config.jitter_clip);
    config.append_positional_channel =
        readOrDefault<bool>(dataset, "append_positional_channel", config.append_positional_channel);
    config.omit_parameter_ranges =
        readOrDefault<std::vector<int>>(dataset, "omit_parameter_ranges", {});
    config.categorical_indexes = readOrDefault<std::vector<int>>(dataset, "categorical_indexes", {});
    config.categorical_sizes = readOrDefault<std::vector<int>>(dataset, "categorical_sizes", {});
    config.seed = readOptional<uint32_t>(dataset, "seed");
    config.verbose = readOrDefault<bool>(dataset, "verbose", config.verbose);

    config.train = parseSplitConfig(params["train"], config.train);
    config.test = parseSplitConfig(params["test"], config.test);

    const YAML::Node export_node = params["export"];
    config.export_file = readOrDefault<std::string>(export_node, "output_file", "");
    config.export_split = readOrDefault<std::string>(export_node, "split", config.export_split);
    return config;
}

}  // namespace

DatasetConfig loadDatasetConfigFromYaml(const std::string& path) {
    YAML::Node root = YAML::LoadFile(path);
    YAML::Node params = extractParameterNode(root);
    return parseDatasetConfig(params);
}

std::vector<std::string> DatasetConfig::validate(bool check_filesystem) const {
    std::vector<std::string> errors;
    if (root.empty()) {
        errors.emplace_back("root is empty");
    } else if (check_filesystem && !std::filesystem::is_directory(root)) {
        errors.emplace_back("root is not a directory: " + root);
    }

    if (batch_size <= 0) {
        errors.emplace_back("batch_size must be greater than zero");
    }
    for (const SplitConfig* split : {&train, &test}) {
        if (split->batch_size && *split->batch_size <= 0) {
            errors.emplace_back("split batch_size must be greater than zero");
        }
    }
    if (num_points <= 0) {
        errors.emplace_back("num_points must be greater than zero");
    }
    if (cache_size < 0) {
        errors.emplace_back("cache_size must be non-negative");
    }

    Split export_split_value;
    if (!parseSplit(export_split, export_split_value)) {
        errors.emplace_back("export split must be 'train' or 'test', got '" + export_split + "'");
    }

    auto transform_errors = optionsFromConfig(*this, Split::Train).transformOptions().validate();
    errors.insert(errors.end(), transform_errors.begin(), transform_errors.end());
    auto augmentation_errors = optionsFromConfig(*this, Split::Train).augmentationOptions().validate();
    errors.insert(errors.end(), augmentation_errors.begin(), augmentation_errors.end());
    return errors;
}

DatasetOptions optionsFromConfig(const DatasetConfig& config, Split split) {
    const SplitConfig& split_config = config.splitConfig(split);

    DatasetOptions options;
    options.root = config.root;
    options.split = split;
    const int batch_size = split_config.batch_size.value_or(config.batch_size);
    options.batch_size = batch_size > 0 ? static_cast<std::size_t>(batch_size) : 0;
    options.num_points = config.num_points > 0 ? static_cast<std::size_t>(config.num_points) : 0;
    options.normalize = config.normalize;
    options.include_normals = config.include_normals;
    options.cache_size = config.cache_size > 0 ? static_cast<std::size_t>(config.cache_size) : 0;
    options.shuffle = split_config.shuffle;
    options.shuffle_points = split_config.shuffle_points.value_or(config.shuffle_points);
    options.scale_low = static_cast<float>(config.scale_low);
    options.scale_high = static_cast<float>(config.scale_high);
    options.shift_range = static_cast<float>(config.shift_range);
    options.jitter_sigma = static_cast<float>(config.jitter_sigma);
    options.jitter_clip = static_cast<float>(config.jitter_clip);
    options.append_positional_channel = config.append_positional_channel;
    options.omit_parameter_ranges = config.omit_parameter_ranges;
    options.categorical_indexes = config.categorical_indexes;
    options.categorical_sizes = config.categorical_sizes;
    options.seed = config.seed;
    options.verbose = config.verbose;
    return options;
}

}  // namespace pointcloud_dataset::config
