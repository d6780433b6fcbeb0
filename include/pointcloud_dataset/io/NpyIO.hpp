// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_IO_NPY_IO_HPP
#define POINTCLOUD_DATASET_IO_NPY_IO_HPP

#include <cstddef>
#include <fstream>
#include <string>
#include <vector>

#include "pointcloud_dataset/model/PointArray.hpp"

namespace pointcloud_dataset {

struct NpyHeader {
    int major_version = 0;
    int minor_version = 0;
    std::string descr;
    bool fortran_order = false;
    std::vector<std::size_t> shape;

    char byteOrder() const { return descr.empty() ? '\0' : descr[0]; }
    char kind() const { return descr.size() < 2 ? '\0' : descr[1]; }
    std::size_t itemSize() const;
    // False when the shape or its byte size overflows std::size_t.
    bool elementCount(std::size_t& count) const;
    bool payloadBytes(std::size_t& bytes) const;
};

// Reader/writer for NumPy .npy arrays holding one sample as (points, channels).
class NpyIO {
public:
    static bool readNpyFile(const std::string& filename, PointArray& points, std::string& error);

    // Writes a version 1.0, little-endian float32, C-order array.
    static bool writeNpyFile(const std::string& filename, const PointArray& points, std::string& error);

    static bool parseHeader(const std::string& filename, NpyHeader& header);

    static bool hasMagic(const char* bytes, std::size_t size);

private:
    static bool parseHeaderInternal(std::ifstream& file, NpyHeader& header, std::string& error);
    static bool parseHeaderDict(const std::string& dict, NpyHeader& header, std::string& error);
    static bool convertPayload(const std::vector<char>& raw, const NpyHeader& header,
                               std::vector<float>& out, std::string& error);
};

}  // namespace pointcloud_dataset

#endif  // POINTCLOUD_DATASET_IO_NPY_IO_HPP
