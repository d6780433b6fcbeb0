// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_CONFIG_CLI_CONFIG_PARSER_HPP
#define POINTCLOUD_DATASET_CONFIG_CLI_CONFIG_PARSER_HPP

#include <optional>
#include <string>
#include <vector>

namespace pointcloud_dataset::config {

struct CliArguments {
    std::string config_path;
    std::optional<std::string> split;        // --split train|test
    std::optional<std::string> output_file;  // --output <file.h5>
};

// Accepts "<config.yaml> [--split <name>] [--output <file>]".
// Throws std::invalid_argument on anything else.
CliArguments parseCliArguments(const std::vector<std::string>& args);

std::string parseConfigPath(const std::vector<std::string>& args);

}  // namespace pointcloud_dataset::config

#endif  // POINTCLOUD_DATASET_CONFIG_CLI_CONFIG_PARSER_HPP
