// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "pointcloud_dataset/io/PcdIO.hpp"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace pointcloud_dataset {

namespace {

template <typename T>
float readScalar(const char* bytes) {
    T value;
    std::memcpy(&value, bytes, sizeof(T));
    return static_cast<float>(value);
}

bool decodeScalar(const char* bytes, char type, int size, float& out) {
    switch (type) {
        case 'F':
            if (size == 4) { out = readScalar<float>(bytes); return true; }
            if (size == 8) { out = readScalar<double>(bytes); return true; }
            return false;
        case 'I':
            if (size == 1) { out = readScalar<int8_t>(bytes); return true; }
            if (size == 2) { out = readScalar<int16_t>(bytes); return true; }
            if (size == 4) { out = readScalar<int32_t>(bytes); return true; }
            if (size == 8) { out = readScalar<int64_t>(bytes); return true; }
            return false;
        case 'U':
            if (size == 1) { out = readScalar<uint8_t>(bytes); return true; }
            if (size == 2) { out = readScalar<uint16_t>(bytes); return true; }
            if (size == 4) { out = readScalar<uint32_t>(bytes); return true; }
            if (size == 8) { out = readScalar<uint64_t>(bytes); return true; }
            return false;
        default:
            return false;
    }
}

bool checkFieldLayout(const PcdHeader& header, std::string& error) {
    const std::size_t fields = header.fields.size();
    if (!header.counts.empty() && header.counts.size() != fields) {
        std::ostringstream oss;
        oss << "PCD COUNT lists " << header.counts.size() << " entries for " << fields << " fields";
        error = oss.str();
        return false;
    }
    if (!header.sizes.empty() && header.sizes.size() != fields) {
        std::ostringstream oss;
        oss << "PCD SIZE lists " << header.sizes.size() << " entries for " << fields << " fields";
        error = oss.str();
        return false;
    }
    for (int count : header.counts) {
        if (count <= 0) {
            error = "PCD COUNT entries must be positive";
            return false;
        }
    }
    for (int size : header.sizes) {
        if (size <= 0) {
            error = "PCD SIZE entries must be positive";
            return false;
        }
    }
    return true;
}

}  // namespace

std::size_t PcdHeader::channelCount() const {
    if (counts.empty()) {
        return fields.size();
    }
    std::size_t total = 0;
    for (int count : counts) {
        total += static_cast<std::size_t>(count);
    }
    return total;
}

bool PcdIO::readPcdFile(const std::string& filename, PointArray& points, std::string& error) {
    points.clear();

    if (!std::filesystem::exists(filename)) {
        error = "File does not exist: " + filename;
        return false;
    }

    std::ifstream file(filename);
    if (!file.is_open()) {
        error = "Cannot open file: " + filename;
        return false;
    }

    file.seekg(0, std::ios::end);
    if (file.tellg() == 0) {
        error = "File is empty: " + filename;
        return false;
    }
    file.seekg(0, std::ios::beg);

    PcdHeader header;
    if (!parseHeaderInternal(file, header)) {
        error = "Failed to parse PCD header: " + filename;
        return false;
    }
    if (!checkFieldLayout(header, error)) {
        error += ": " + filename;
        return false;
    }

    if (header.data_type == "ascii") {
        return readAsciiData(file, points, header, error);
    } else if (header.data_type == "binary") {
        // Binary payload has to be read through a binary-mode stream
        std::streampos data_start = file.tellg();
        file.close();

        std::ifstream binary_file(filename, std::ios::binary);
        if (!binary_file.is_open()) {
            error = "Cannot reopen file in binary mode: " + filename;
            return false;
        }
        binary_file.seekg(data_start);
        return readBinaryData(binary_file, points, header, error);
    }

    error = "Unsupported PCD data type '" + header.data_type + "': " + filename;
    return false;
}

bool PcdIO::writePcdFile(const std::string& filename, const PointArray& points, std::string& error) {
    std::filesystem::path filepath(filename);
    std::filesystem::path dir = filepath.parent_path();

    if (!dir.empty() && !std::filesystem::exists(dir)) {
        error = "Directory does not exist: " + dir.string();
        return false;
    }

    std::ofstream file(filename);
    if (!file.is_open()) {
        error = "Cannot create file: " + filename;
        return false;
    }

    if (!writeHeader(file, points)) {
        error = "Failed to write PCD header: " + filename;
        return false;
    }

    if (!writeAsciiData(file, points)) {
        error = "Failed to write PCD data: " + filename;
        return false;
    }

    file.close();
    return true;
}

bool PcdIO::parseHeader(const std::string& filename, PcdHeader& header) {
    if (!std::filesystem::exists(filename)) {
        return false;
    }

    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    return parseHeaderInternal(file, header);
}

bool PcdIO::parseHeaderInternal(std::ifstream& file, PcdHeader& header) {
    std::string line;
    bool found_data = false;

    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::istringstream iss(line);
        std::string key;
        iss >> key;

        if (key == "VERSION") {
            iss >> header.version;
        } else if (key == "FIELDS") {
            std::string field;
            while (iss >> field) {
                header.fields.push_back(field);
            }
        } else if (key == "SIZE") {
            int size = 0;
            while (iss >> size) {
                header.sizes.push_back(size);
            }
        } else if (key == "TYPE") {
            char type = 0;
            while (iss >> type) {
                header.types.push_back(type);
            }
        } else if (key == "COUNT") {
            int count = 0;
            while (iss >> count) {
                header.counts.push_back(count);
            }
        } else if (key == "WIDTH") {
            iss >> header.width;
        } else if (key == "HEIGHT") {
            iss >> header.height;
        } else if (key == "POINTS") {
            iss >> header.points;
        } else if (key == "DATA") {
            iss >> header.data_type;
            found_data = true;
            break;  // DATA is the last header entry
        }
    }

    if (header.points == 0 && header.width > 0) {
        header.points = header.width * (header.height > 0 ? header.height : 1);
    }

    return found_data && header.points > 0 && !header.fields.empty();
}

bool PcdIO::readAsciiData(std::ifstream& file, PointArray& points, const PcdHeader& header,
                          std::string& error) {
    const std::size_t channels = header.channelCount();
    points.rows = 0;
    points.cols = channels;
    points.values.reserve(static_cast<std::size_t>(header.points) * channels);

    std::string line;
    int points_read = 0;
    while (points_read < header.points && std::getline(file, line)) {
        if (line.empty()) continue;

        std::istringstream iss(line);
        std::size_t parsed = 0;
        float value = 0.0f;
        while (parsed < channels && iss >> value) {
            points.values.push_back(value);
            ++parsed;
        }
        if (parsed != channels) {
            std::ostringstream oss;
            oss << "PCD row " << points_read << " has " << parsed << " values, expected " << channels;
            error = oss.str();
            points.clear();
            return false;
        }
        ++points_read;
    }

    if (points_read != header.points) {
        std::ostringstream oss;
        oss << "Expected " << header.points << " PCD points, read " << points_read;
        error = oss.str();
        points.clear();
        return false;
    }

    points.rows = static_cast<std::size_t>(points_read);
    return true;
}

bool PcdIO::readBinaryData(std::ifstream& file, PointArray& points, const PcdHeader& header,
                           std::string& error) {
    const std::size_t fields = header.fields.size();
    if (header.sizes.size() != fields || header.types.size() != fields) {
        error = "Binary PCD requires SIZE and TYPE for every field";
        return false;
    }

    std::size_t point_step = 0;
    for (std::size_t f = 0; f < fields; ++f) {
        const int count = header.counts.empty() ? 1 : header.counts[f];
        point_step += static_cast<std::size_t>(header.sizes[f]) * static_cast<std::size_t>(count);
    }

    const std::size_t channels = header.channelCount();
    points.rows = static_cast<std::size_t>(header.points);
    points.cols = channels;
    points.values.assign(points.rows * channels, 0.0f);

    std::vector<char> buffer(point_step);
    for (std::size_t i = 0; i < points.rows; ++i) {
        file.read(buffer.data(), static_cast<std::streamsize>(point_step));
        if (static_cast<std::size_t>(file.gcount()) != point_step) {
            std::ostringstream oss;
            oss << "Failed to read binary PCD data at point " << i;
            error = oss.str();
            points.clear();
            return false;
        }

        std::size_t offset = 0;
        std::size_t channel = 0;
        for (std::size_t f = 0; f < fields; ++f) {
            const int count = header.counts.empty() ? 1 : header.counts[f];
            for (int c = 0; c < count; ++c) {
                float value = 0.0f;
                if (!decodeScalar(buffer.data() + offset, header.types[f], header.sizes[f], value)) {
                    error = "Unsupported PCD field type for '" + header.fields[f] + "'";
                    points.clear();
                    return false;
                }
                points.at(i, channel++) = value;
                offset += static_cast<std::size_t>(header.sizes[f]);
            }
        }
    }

    return true;
}

bool PcdIO::writeHeader(std::ofstream& file, const PointArray& points) {
    static const char* kXyz[] = {"x", "y", "z"};

    file << "# .PCD v0.7 - Point Cloud Data file format\n";
    file << "VERSION 0.7\n";
    file << "FIELDS";
    for (std::size_t c = 0; c < points.cols; ++c) {
        if (c < 3) {
            file << " " << kXyz[c];
        } else {
            file << " c" << c;
        }
    }
    file << "\nSIZE";
    for (std::size_t c = 0; c < points.cols; ++c) file << " 4";
    file << "\nTYPE";
    for (std::size_t c = 0; c < points.cols; ++c) file << " F";
    file << "\nCOUNT";
    for (std::size_t c = 0; c < points.cols; ++c) file << " 1";
    file << "\n";
    file << "WIDTH " << points.rows << "\n";
    file << "HEIGHT 1\n";
    file << "VIEWPOINT 0 0 0 1 0 0 0\n";
    file << "POINTS " << points.rows << "\n";
    file << "DATA ascii\n";

    return file.good();
}

bool PcdIO::writeAsciiData(std::ofstream& file, const PointArray& points) {
    file << std::fixed << std::setprecision(6);

    for (std::size_t r = 0; r < points.rows; ++r) {
        for (std::size_t c = 0; c < points.cols; ++c) {
            if (c != 0) {
                file << " ";
            }
            file << points.at(r, c);
        }
        file << "\n";
    }

    return file.good();
}

}  // namespace pointcloud_dataset
