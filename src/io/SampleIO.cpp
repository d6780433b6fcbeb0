// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "pointcloud_dataset/io/SampleIO.hpp"

#include <filesystem>

#include "pointcloud_dataset/io/HDF5IO.hpp"
#include "pointcloud_dataset/io/NpyIO.hpp"
#include "pointcloud_dataset/io/PcdIO.hpp"

namespace pointcloud_dataset {

bool SampleIO::loadSample(const std::string& filename, PointArray& points, std::string& error) {
    points.clear();

    if (!std::filesystem::exists(filename)) {
        error = "File does not exist: " + filename;
        return false;
    }

    FileFormat format = FileFormatDetector::detectFormat(filename);
    return loadSample(filename, points, format, error);
}

bool SampleIO::loadSample(const std::string& filename, PointArray& points, FileFormat format,
                          std::string& error) {
    points.clear();

    std::string detail;
    bool ok = false;
    switch (format) {
        case FileFormat::NPY:
            ok = NpyIO::readNpyFile(filename, points, detail);
            break;
        case FileFormat::PCD:
            ok = PcdIO::readPcdFile(filename, points, detail);
            break;
        case FileFormat::HDF5: {
            HDF5IO hdf5_io;
            ok = hdf5_io.readPoints(filename, points);
            if (!ok) {
                detail = hdf5_io.getLastError();
            }
            break;
        }
        case FileFormat::UNKNOWN:
        default:
            detail = "unrecognized sample format";
            break;
    }

    if (!ok) {
        error = getErrorMessage("load", filename, format);
        if (!detail.empty()) {
            error += ": " + detail;
        }
    }
    return ok;
}

bool SampleIO::saveSample(const std::string& filename, const PointArray& points, std::string& error) {
    return saveSample(filename, points, FileFormatDetector::detectByExtension(filename), error);
}

bool SampleIO::saveSample(const std::string& filename, const PointArray& points, FileFormat format,
                          std::string& error) {
    std::string detail;
    bool ok = false;
    switch (format) {
        case FileFormat::NPY:
            ok = NpyIO::writeNpyFile(filename, points, detail);
            break;
        case FileFormat::PCD:
            ok = PcdIO::writePcdFile(filename, points, detail);
            break;
        case FileFormat::HDF5: {
            HDF5IO hdf5_io;
            ok = hdf5_io.writePoints(filename, points);
            if (!ok) {
                detail = hdf5_io.getLastError();
            }
            break;
        }
        case FileFormat::UNKNOWN:
        default:
            detail = "unrecognized sample format";
            break;
    }

    if (!ok) {
        error = getErrorMessage("save", filename, format);
        if (!detail.empty()) {
            error += ": " + detail;
        }
    }
    return ok;
}

bool SampleIO::hasSupportedExtension(const std::string& filename) {
    FileFormat format = FileFormatDetector::detectByExtension(filename);
    return FileFormatDetector::isSupportedFormat(format);
}

std::string SampleIO::getErrorMessage(const std::string& operation, const std::string& filename,
                                      FileFormat format) {
    std::string format_str = FileFormatDetector::formatToString(format);
    return "Failed to " + operation + " " + format_str + " file: " + filename;
}

}  // namespace pointcloud_dataset
