// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_IO_SAMPLE_IO_HPP
#define POINTCLOUD_DATASET_IO_SAMPLE_IO_HPP

#include <string>
#include <vector>

#include "pointcloud_dataset/io/FileFormatDetector.hpp"
#include "pointcloud_dataset/model/PointArray.hpp"

namespace pointcloud_dataset {

// Format-dispatching entry point for reading and writing one sample file.
class SampleIO {
public:
    static bool loadSample(const std::string& filename, PointArray& points, std::string& error);

    static bool loadSample(const std::string& filename, PointArray& points, FileFormat format,
                           std::string& error);

    // Output format is chosen from the file extension.
    static bool saveSample(const std::string& filename, const PointArray& points, std::string& error);

    static bool saveSample(const std::string& filename, const PointArray& points, FileFormat format,
                           std::string& error);

    static bool hasSupportedExtension(const std::string& filename);

private:
    static std::string getErrorMessage(const std::string& operation, const std::string& filename,
                                       FileFormat format);
};

}  // namespace pointcloud_dataset

#endif  // POINTCLOUD_DATASET_IO_SAMPLE_IO_HPP
