// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "pointcloud_dataset/config/CliConfigParser.hpp"

#include <stdexcept>

namespace pointcloud_dataset::config {

namespace {

std::string takeValue(const std::vector<std::string>& args, std::size_t& i) {
    const std::string& flag = args[i];
    if (i + 1 >= args.size() || args[i + 1].empty()) {
        throw std::invalid_argument("Option " + flag + " requires a value");
    }
    return args[++i];
}

}  // namespace

CliArguments parseCliArguments(const std::vector<std::string>& args) {
    CliArguments parsed;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--split") {
            parsed.split = takeValue(args, i);
        } else if (arg == "--output") {
            parsed.output_file = takeValue(args, i);
        } else if (arg.rfind("--", 0) == 0) {
            throw std::invalid_argument("Unknown option '" + arg + "'");
        } else if (parsed.config_path.empty() && !arg.empty()) {
            parsed.config_path = arg;
        } else if (arg.empty()) {
            throw std::invalid_argument("Configuration path must not be empty");
        } else {
            throw std::invalid_argument("Expected exactly one configuration path argument");
        }
    }

    if (parsed.config_path.empty()) {
        throw std::invalid_argument("Expected exactly one configuration path argument");
    }
    return parsed;
}

std::string parseConfigPath(const std::vector<std::string>& args) {
    const CliArguments parsed = parseCliArguments(args);
    if (parsed.split || parsed.output_file) {
        throw std::invalid_argument("This command takes only a configuration path");
    }
    return parsed.config_path;
}

}  // namespace pointcloud_dataset::config
