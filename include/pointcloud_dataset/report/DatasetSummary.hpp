// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_REPORT_DATASET_SUMMARY_HPP
#define POINTCLOUD_DATASET_REPORT_DATASET_SUMMARY_HPP

#include <string>

#include "pointcloud_dataset/core/FeatureTransformer.hpp"
#include "pointcloud_dataset/core/PointCloudDataset.hpp"

namespace pointcloud_dataset {

std::string formatTransformPlan(const FeatureTransformer& transformer, std::size_t decoded_width);

std::string formatDatasetSummary(const PointCloudDataset& dataset);

}  // namespace pointcloud_dataset

#endif  // POINTCLOUD_DATASET_REPORT_DATASET_SUMMARY_HPP
