// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_CORE_CLASS_WEIGHTS_HPP
#define POINTCLOUD_DATASET_CORE_CLASS_WEIGHTS_HPP

#include <cstddef>
#include <vector>

#include "pointcloud_dataset/core/ClassCatalog.hpp"

namespace pointcloud_dataset {

// Inverse-frequency weights normalized to unit mean, indexed by class id.
std::vector<float> computeClassWeights(const std::vector<std::size_t>& class_counts);

std::vector<float> computeClassWeights(const ClassCatalog& catalog);

}  // namespace pointcloud_dataset

#endif  // POINTCLOUD_DATASET_CORE_CLASS_WEIGHTS_HPP
