// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "pointcloud_dataset/io/FileFormatDetector.hpp"
#include "pointcloud_dataset/io/HDF5IO.hpp"
#include "pointcloud_dataset/io/NpyIO.hpp"
#include "pointcloud_dataset/io/PcdIO.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace pointcloud_dataset {

FileFormat FileFormatDetector::detectFormat(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        return FileFormat::UNKNOWN;
    }

    // First try content-based detection (more reliable)
    FileFormat content_format = detectByContent(filename);
    if (content_format != FileFormat::UNKNOWN) {
        return content_format;
    }

    return detectByExtension(filename);
}

FileFormat FileFormatDetector::detectByExtension(const std::string& filename) {
    if (filename.empty()) {
        return FileFormat::UNKNOWN;
    }

    std::string normalized = normalizeExtension(getFileExtension(filename));

    if (normalized == ".npy") {
        return FileFormat::NPY;
    } else if (normalized == ".pcd") {
        return FileFormat::PCD;
    } else if (normalized == ".h5" || normalized == ".hdf5") {
        return FileFormat::HDF5;
    }

    return FileFormat::UNKNOWN;
}

FileFormat FileFormatDetector::detectByContent(const std::string& filename) {
    if (!std::filesystem::exists(filename) || std::filesystem::is_directory(filename)) {
        return FileFormat::UNKNOWN;
    }

    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        return FileFormat::UNKNOWN;
    }

    char magic[8] = {0};
    file.read(magic, sizeof(magic));
    const std::streamsize got = file.gcount();
    file.close();

    if (got >= 6 && NpyIO::hasMagic(magic, static_cast<std::size_t>(got))) {
        return FileFormat::NPY;
    }

    if (got == 8 && static_cast<unsigned char>(magic[0]) == 0x89 &&
        magic[1] == 'H' && magic[2] == 'D' && magic[3] == 'F') {
        return HDF5IO::isValidHDF5(filename) ? FileFormat::HDF5 : FileFormat::UNKNOWN;
    }

    // PCD headers are text; look for one of the well-known keys near the top
    std::ifstream text(filename);
    std::string line;
    int lines_read = 0;
    constexpr int lines_to_read = 5;
    while (lines_read < lines_to_read && std::getline(text, line)) {
        const auto last_non_ws = line.find_last_not_of(" \n\r\t");
        if (last_non_ws == std::string::npos) {
            continue;
        }
        ++lines_read;
        if (line.find("# .PCD") == 0 ||
            line.find("VERSION") == 0 ||
            line.find("FIELDS") == 0 ||
            line.find("POINTS") == 0) {
            PcdHeader header;
            return PcdIO::parseHeader(filename, header) ? FileFormat::PCD : FileFormat::UNKNOWN;
        }
    }

    return FileFormat::UNKNOWN;
}

std::string FileFormatDetector::formatToString(FileFormat format) {
    switch (format) {
        case FileFormat::NPY:
            return "NPY";
        case FileFormat::PCD:
            return "PCD";
        case FileFormat::HDF5:
            return "HDF5";
        case FileFormat::UNKNOWN:
        default:
            return "UNKNOWN";
    }
}

bool FileFormatDetector::isSupportedFormat(FileFormat format) {
    return format == FileFormat::NPY || format == FileFormat::PCD || format == FileFormat::HDF5;
}

std::vector<std::string> FileFormatDetector::supportedExtensions() {
    return {".npy", ".pcd", ".h5", ".hdf5"};
}

std::string FileFormatDetector::getFileExtension(const std::string& filename) {
    if (filename.empty()) {
        return "";
    }

    size_t dot_pos = filename.find_last_of('.');
    size_t slash_pos = filename.find_last_of("/\\");

    // Dot must belong to the last path component and not be the final character
    if (dot_pos == std::string::npos ||
        (slash_pos != std::string::npos && dot_pos < slash_pos) ||
        dot_pos == filename.length() - 1) {
        return "";
    }

    // A leading dot alone ("/path/.hidden") is not an extension
    size_t filename_start = (slash_pos == std::string::npos) ? 0 : slash_pos + 1;
    if (dot_pos == filename_start) {
        return "";
    }

    return filename.substr(dot_pos);
}

std::string FileFormatDetector::normalizeExtension(const std::string& extension) {
    std::string normalized = extension;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return normalized;
}

}  // namespace pointcloud_dataset
