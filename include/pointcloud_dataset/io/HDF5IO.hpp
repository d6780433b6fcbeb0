// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <hdf5.h>
#include <hdf5_hl.h>

#include "pointcloud_dataset/model/PointArray.hpp"

namespace pointcloud_dataset {

// One exported epoch: every batch concatenated along the example axis.
struct EpochData {
    std::string split;
    uint32_t num_points = 0;
    uint32_t num_channels = 0;
    std::vector<float> data;
    std::vector<int32_t> labels;
    std::vector<float> weights;
    std::vector<std::string> class_names;

    std::size_t numExamples() const { return labels.size(); }
};

class HDF5IO {
public:
    HDF5IO() = default;
    ~HDF5IO() = default;

    // Sample files keep their points in a 2-D "/points" dataset.
    bool readPoints(const std::string& filename, PointArray& points);
    bool writePoints(const std::string& filename, const PointArray& points);

    bool writeEpoch(const std::string& filename, const EpochData& epoch);
    bool readEpoch(const std::string& filename, EpochData& epoch);

    static bool isValidHDF5(const std::string& filename);

    std::string getLastError() const { return last_error_; }

private:
    std::string last_error_;

    bool checkParentDirectory(const std::string& filename);
    bool writeClassNames(hid_t file_id, const std::vector<std::string>& names);
    bool readClassNames(hid_t file_id, std::vector<std::string>& names);
    bool writeStringAttribute(hid_t loc_id, const std::string& name, const std::string& value);
    bool readStringAttribute(hid_t loc_id, const std::string& name, std::string& value);
};

}  // namespace pointcloud_dataset
