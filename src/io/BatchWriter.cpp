// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "pointcloud_dataset/io/BatchWriter.hpp"

namespace pointcloud_dataset::io {

EpochData collectEpoch(PointCloudDataset& dataset, bool augment) {
    EpochData epoch;
    epoch.split = splitToString(dataset.catalog().split());
    epoch.num_points = static_cast<uint32_t>(dataset.numPoints());
    epoch.num_channels = static_cast<uint32_t>(dataset.numChannels());
    epoch.class_names = dataset.classNames();
    epoch.data.reserve(dataset.size() * dataset.numPoints() * dataset.numChannels());
    epoch.labels.reserve(dataset.size());
    epoch.weights.reserve(dataset.size());

    dataset.reset();
    while (dataset.hasNextBatch()) {
        SampleBatch batch = dataset.nextBatch(augment);
        epoch.data.insert(epoch.data.end(), batch.data.begin(), batch.data.end());
        epoch.labels.insert(epoch.labels.end(), batch.labels.begin(), batch.labels.end());
        epoch.weights.insert(epoch.weights.end(), batch.weights.begin(), batch.weights.end());
    }
    return epoch;
}

bool writeEpoch(const std::string& output_path,
                PointCloudDataset& dataset,
                bool augment,
                std::string& error_message) {
    if (output_path.empty()) {
        error_message = "Export output path is empty";
        return false;
    }

    const EpochData epoch = collectEpoch(dataset, augment);

    HDF5IO hdf5_io;
    if (!hdf5_io.writeEpoch(output_path, epoch)) {
        if (!error_message.empty()) {
            error_message.append("; ");
        }
        error_message.append("HDF5 write failed: ");
        error_message.append(hdf5_io.getLastError());
        return false;
    }
    return true;
}

}  // namespace pointcloud_dataset::io
