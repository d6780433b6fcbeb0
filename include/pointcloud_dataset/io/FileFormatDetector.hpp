// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_IO_FILE_FORMAT_DETECTOR_HPP
#define POINTCLOUD_DATASET_IO_FILE_FORMAT_DETECTOR_HPP

#include <string>
#include <vector>

namespace pointcloud_dataset {

// Supported sample file formats
enum class FileFormat {
    UNKNOWN,
    NPY,
    PCD,
    HDF5
};

// File format detection utility
class FileFormatDetector {
public:
    // Detect file format by content, falling back to the extension
    static FileFormat detectFormat(const std::string& filename);

    // Detect format by file extension only
    static FileFormat detectByExtension(const std::string& filename);

    // Detect format by file content (magic bytes / header)
    static FileFormat detectByContent(const std::string& filename);

    static std::string formatToString(FileFormat format);

    static bool isSupportedFormat(FileFormat format);

    static std::vector<std::string> supportedExtensions();

    // Get file extension from filename
    static std::string getFileExtension(const std::string& filename);

private:
    static std::string normalizeExtension(const std::string& extension);
};

}  // namespace pointcloud_dataset

#endif  // POINTCLOUD_DATASET_IO_FILE_FORMAT_DETECTOR_HPP
