// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "pointcloud_dataset/core/ClassWeights.hpp"

#include "pointcloud_dataset/common/DatasetErrors.hpp"

namespace pointcloud_dataset {

std::vector<float> computeClassWeights(const std::vector<std::size_t>& class_counts) {
    std::vector<float> weights;
    if (class_counts.empty()) {
        return weights;
    }

    std::vector<double> inverse(class_counts.size(), 0.0);
    double sum = 0.0;
    for (std::size_t i = 0; i < class_counts.size(); ++i) {
        if (class_counts[i] == 0) {
            throw CatalogError("Class id " + std::to_string(i) + " has no samples");
        }
        inverse[i] = 1.0 / static_cast<double>(class_counts[i]);
        sum += inverse[i];
    }

    const double mean = sum / static_cast<double>(inverse.size());
    weights.reserve(inverse.size());
    for (double value : inverse) {
        weights.push_back(static_cast<float>(value / mean));
    }
    return weights;
}

std::vector<float> computeClassWeights(const ClassCatalog& catalog) {
    return computeClassWeights(catalog.classCounts());
}

}  // namespace pointcloud_dataset
