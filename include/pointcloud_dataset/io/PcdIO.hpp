// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_IO_PCD_IO_HPP
#define POINTCLOUD_DATASET_IO_PCD_IO_HPP

#include <cstddef>
#include <fstream>
#include <string>
#include <vector>

#include "pointcloud_dataset/model/PointArray.hpp"

namespace pointcloud_dataset {

struct PcdHeader {
    std::string version;
    int width;
    int height;
    int points;
    std::string data_type;
    std::vector<std::string> fields;
    std::vector<int> sizes;
    std::vector<char> types;
    std::vector<int> counts;

    PcdHeader() : width(0), height(0), points(0), data_type("ascii") {}

    // Total number of scalar channels per point (sum of COUNT).
    std::size_t channelCount() const;
};

// Reads every PCD field into a (points, channels) array, field order preserved.
class PcdIO {
public:
    static bool readPcdFile(const std::string& filename, PointArray& points, std::string& error);

    // Writes ASCII PCD; channels 0..2 are named x y z, the rest c3, c4, ...
    static bool writePcdFile(const std::string& filename, const PointArray& points, std::string& error);

    static bool parseHeader(const std::string& filename, PcdHeader& header);

private:
    static bool parseHeaderInternal(std::ifstream& file, PcdHeader& header);
    static bool readAsciiData(std::ifstream& file, PointArray& points, const PcdHeader& header,
                              std::string& error);
    static bool readBinaryData(std::ifstream& file, PointArray& points, const PcdHeader& header,
                               std::string& error);
    static bool writeHeader(std::ofstream& file, const PointArray& points);
    static bool writeAsciiData(std::ofstream& file, const PointArray& points);
};

}  // namespace pointcloud_dataset

#endif  // POINTCLOUD_DATASET_IO_PCD_IO_HPP
