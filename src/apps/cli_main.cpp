// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "pointcloud_dataset/common/DatasetErrors.hpp"
#include "pointcloud_dataset/config/CliConfigParser.hpp"
#include "pointcloud_dataset/config/DatasetConfig.hpp"
#include "pointcloud_dataset/core/ClassCatalog.hpp"
#include "pointcloud_dataset/core/PointCloudDataset.hpp"
#include "pointcloud_dataset/io/BatchWriter.hpp"
#include "pointcloud_dataset/report/DatasetSummary.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using pointcloud_dataset::PointCloudDataset;
using pointcloud_dataset::Split;
using pointcloud_dataset::config::CliArguments;
using pointcloud_dataset::config::DatasetConfig;
using pointcloud_dataset::config::loadDatasetConfigFromYaml;
using pointcloud_dataset::config::optionsFromConfig;
using pointcloud_dataset::config::parseCliArguments;
using pointcloud_dataset::config::parseConfigPath;

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <command> [options]\n";
    std::cout << "\nCommands:\n";
    std::cout << "  inspect <config.yaml>                     - Build both splits and print a summary\n";
    std::cout << "  export <config.yaml> [--split <train|test>] [--output <file.h5>]\n";
    std::cout << "                                            - Write one epoch of batches to HDF5\n";
}

std::optional<DatasetConfig> loadValidatedConfig(const std::string& config_path,
                                                 const CliArguments* overrides = nullptr) {
    DatasetConfig config;
    try {
        config = loadDatasetConfigFromYaml(config_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return std::nullopt;
    }

    if (overrides) {
        if (overrides->split) {
            config.export_split = *overrides->split;
        }
        if (overrides->output_file) {
            config.export_file = *overrides->output_file;
        }
    }

    auto errors = config.validate();
    if (!errors.empty()) {
        for (const auto& err : errors) {
            std::cerr << "Config error: " << err << "\n";
        }
        return std::nullopt;
    }
    return config;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];

    try {
        if (command == "inspect") {
            std::vector<std::string> args(argv + 2, argv + argc);
            std::string config_path;
            try {
                config_path = parseConfigPath(args);
            } catch (const std::exception& e) {
                std::cerr << e.what() << "\n";
                printUsage(argv[0]);
                return 1;
            }

            auto config = loadValidatedConfig(config_path);
            if (!config) {
                return 1;
            }

            try {
                PointCloudDataset train(optionsFromConfig(*config, Split::Train));
                PointCloudDataset test(optionsFromConfig(*config, Split::Test));
                pointcloud_dataset::ClassCatalog::verifyCompatible(train.catalog(), test.catalog());

                std::cout << pointcloud_dataset::formatDatasetSummary(train) << "\n";
                std::cout << pointcloud_dataset::formatDatasetSummary(test) << "\n";
            } catch (const pointcloud_dataset::DatasetError& e) {
                std::cerr << "Inspection failed: " << e.what() << "\n";
                return 1;
            }

            std::cout << "Processing completed!!\n";

        } else if (command == "export") {
            std::vector<std::string> args(argv + 2, argv + argc);
            CliArguments cli_args;
            try {
                cli_args = parseCliArguments(args);
            } catch (const std::exception& e) {
                std::cerr << e.what() << "\n";
                printUsage(argv[0]);
                return 1;
            }

            auto config = loadValidatedConfig(cli_args.config_path, &cli_args);
            if (!config) {
                return 1;
            }
            if (config->export_file.empty()) {
                std::cerr << "Config error: export.output_file is required for export\n";
                return 1;
            }

            Split split = Split::Train;
            if (!pointcloud_dataset::parseSplit(config->export_split, split)) {
                std::cerr << "Config error: unknown export split '" << config->export_split << "'\n";
                return 1;
            }

            try {
                PointCloudDataset dataset(optionsFromConfig(*config, split));
                const bool augment = config->splitConfig(split).augment;

                const auto start = std::chrono::high_resolution_clock::now();
                std::string error_message;
                if (!pointcloud_dataset::io::writeEpoch(config->export_file, dataset, augment, error_message)) {
                    std::cerr << "Export failed: " << error_message << "\n";
                    return 1;
                }
                const auto end = std::chrono::high_resolution_clock::now();
                const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

                std::cout << pointcloud_dataset::formatDatasetSummary(dataset) << "\n";
                std::cout << "  Augmented        : " << (augment ? "yes" : "no") << "\n";
                std::cout << "  Output archive   : " << config->export_file << "\n";
                std::cout << "[PROFILE][Export] Epoch written in " << duration.count() << " ms\n";
            } catch (const pointcloud_dataset::DatasetError& e) {
                std::cerr << "Export failed: " << e.what() << "\n";
                return 1;
            }

            std::cout << "Processing completed!!\n";

        } else {
            std::cerr << "Error: Unknown command '" << command << "'\n";
            printUsage(argv[0]);
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
