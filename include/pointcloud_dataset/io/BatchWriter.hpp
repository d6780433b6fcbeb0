// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_IO_BATCH_WRITER_HPP
#define POINTCLOUD_DATASET_IO_BATCH_WRITER_HPP

#include <string>

#include "pointcloud_dataset/core/PointCloudDataset.hpp"
#include "pointcloud_dataset/io/HDF5IO.hpp"

namespace pointcloud_dataset::io {

// Resets the dataset and drains one epoch into an EpochData.
EpochData collectEpoch(PointCloudDataset& dataset, bool augment);

// Runs one epoch and writes it to an HDF5 file. Dataset errors propagate as
// exceptions; HDF5 failures are appended to error_message.
bool writeEpoch(const std::string& output_path,
                PointCloudDataset& dataset,
                bool augment,
                std::string& error_message);

}  // namespace pointcloud_dataset::io

#endif  // POINTCLOUD_DATASET_IO_BATCH_WRITER_HPP
