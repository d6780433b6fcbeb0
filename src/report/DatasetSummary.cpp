// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "pointcloud_dataset/report/DatasetSummary.hpp"

#include <iomanip>
#include <sstream>

namespace pointcloud_dataset {

std::string formatTransformPlan(const FeatureTransformer& transformer, std::size_t decoded_width) {
    std::ostringstream oss;
    std::size_t width = decoded_width;
    oss << "  Decoded width    : " << decoded_width << " channels\n";
    for (const auto& step : transformer.sampleSteps()) {
        const std::size_t next = step.outputWidth(width);
        oss << "    " << std::left << std::setw(28) << step.describe() << width << " -> " << next << "\n";
        width = next;
    }
    oss << "  Output width     : " << width << " channels";
    return oss.str();
}

std::string formatDatasetSummary(const PointCloudDataset& dataset) {
    const auto& catalog = dataset.catalog();
    const auto counts = catalog.classCounts();
    const auto& weights = dataset.classWeights();

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6);
    oss << "Dataset summary (" << splitToString(catalog.split()) << "):\n";
    oss << "  Root             : " << dataset.options().root << "\n";
    oss << "  Samples          : " << dataset.size() << "\n";
    oss << "  Classes          : " << dataset.numClasses() << "\n";
    oss << "  Points per sample: " << dataset.numPoints() << "\n";
    oss << "  Channels         : " << dataset.numChannels() << "\n";
    oss << "  Batch size       : " << dataset.options().batch_size
        << " (" << dataset.numBatches() << " batches per epoch)\n";
    oss << "  Shuffle          : " << (dataset.options().shuffleEnabled() ? "yes" : "no") << "\n";
    oss << "  Omission steps   :";
    if (dataset.transformer().decodeSteps().empty()) {
        oss << " none";
    }
    for (const auto& step : dataset.transformer().decodeSteps()) {
        oss << " " << step.describe();
    }
    oss << "\n";
    oss << "  Class weights:\n";
    for (std::size_t i = 0; i < catalog.numClasses(); ++i) {
        oss << "    [" << i << "] " << std::left << std::setw(20) << catalog.classNames()[i]
            << std::right << " samples=" << std::setw(6) << counts[i]
            << " weight=" << weights[i] << "\n";
    }
    oss << "  Cache            : " << dataset.cache().size() << "/" << dataset.cache().capacity()
        << " entries\n";
    oss << formatTransformPlan(dataset.transformer(), dataset.decodedWidth());
    return oss.str();
}

}  // namespace pointcloud_dataset
