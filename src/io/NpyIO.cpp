// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "pointcloud_dataset/io/NpyIO.hpp"

#include <cctype>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <limits>
#include <sstream>

namespace pointcloud_dataset {

namespace {

constexpr char kMagic[] = "\x93NUMPY";
constexpr std::size_t kMagicSize = 6;

template <typename T>
void widenValues(const std::vector<char>& raw, std::size_t count, std::vector<float>& out) {
    out.resize(count);
    for (std::size_t i = 0; i < count; ++i) {
        T value;
        std::memcpy(&value, raw.data() + i * sizeof(T), sizeof(T));
        out[i] = static_cast<float>(value);
    }
}

std::size_t skipSpaces(const std::string& text, std::size_t pos) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    return pos;
}

// Returns the position right after "'key':" or npos.
std::size_t findKey(const std::string& dict, const std::string& key) {
    for (const char quote : {'\'', '"'}) {
        const std::string token = std::string(1, quote) + key + std::string(1, quote);
        std::size_t pos = dict.find(token);
        if (pos == std::string::npos) {
            continue;
        }
        pos = skipSpaces(dict, pos + token.size());
        if (pos < dict.size() && dict[pos] == ':') {
            return skipSpaces(dict, pos + 1);
        }
    }
    return std::string::npos;
}

}  // namespace

std::size_t NpyHeader::itemSize() const {
    if (descr.size() < 3) {
        return 0;
    }
    try {
        return static_cast<std::size_t>(std::stoul(descr.substr(2)));
    } catch (const std::exception&) {
        return 0;
    }
}

bool NpyHeader::elementCount(std::size_t& count) const {
    constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max();
    count = 1;
    for (std::size_t dim : shape) {
        if (dim != 0 && count > kMax / dim) {
            return false;
        }
        count *= dim;
    }
    return true;
}

bool NpyHeader::payloadBytes(std::size_t& bytes) const {
    std::size_t count = 0;
    if (!elementCount(count)) {
        return false;
    }
    const std::size_t item_size = itemSize();
    if (item_size != 0 && count > std::numeric_limits<std::size_t>::max() / item_size) {
        return false;
    }
    bytes = count * item_size;
    return true;
}

bool NpyIO::hasMagic(const char* bytes, std::size_t size) {
    return size >= kMagicSize && std::memcmp(bytes, kMagic, kMagicSize) == 0;
}

bool NpyIO::readNpyFile(const std::string& filename, PointArray& points, std::string& error) {
    points.clear();

    if (!std::filesystem::exists(filename)) {
        error = "File does not exist: " + filename;
        return false;
    }

    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        error = "Cannot open file: " + filename;
        return false;
    }

    NpyHeader header;
    if (!parseHeaderInternal(file, header, error)) {
        error = "Failed to parse NPY header of " + filename + ": " + error;
        return false;
    }

    if (header.shape.empty() || header.shape.size() > 2) {
        error = "NPY array must be 1-D or 2-D: " + filename;
        return false;
    }

    std::size_t payload_size = 0;
    if (!header.payloadBytes(payload_size)) {
        error = "NPY shape too large: " + filename;
        return false;
    }
    std::vector<char> raw(payload_size);
    if (!raw.empty()) {
        file.read(raw.data(), static_cast<std::streamsize>(raw.size()));
        if (static_cast<std::size_t>(file.gcount()) != raw.size()) {
            std::ostringstream oss;
            oss << "Truncated NPY payload in " << filename << " (expected " << raw.size()
                << " bytes, read " << file.gcount() << ")";
            error = oss.str();
            return false;
        }
    }

    std::vector<float> values;
    if (!convertPayload(raw, header, values, error)) {
        error += " in " + filename;
        return false;
    }

    const std::size_t rows = header.shape[0];
    const std::size_t cols = header.shape.size() == 2 ? header.shape[1] : 1;

    points.rows = rows;
    points.cols = cols;
    if (header.fortran_order && header.shape.size() == 2) {
        points.values.resize(rows * cols);
        for (std::size_t c = 0; c < cols; ++c) {
            for (std::size_t r = 0; r < rows; ++r) {
                points.values[r * cols + c] = values[c * rows + r];
            }
        }
    } else {
        points.values = std::move(values);
    }
    return true;
}

bool NpyIO::writeNpyFile(const std::string& filename, const PointArray& points, std::string& error) {
    std::filesystem::path filepath(filename);
    std::filesystem::path dir = filepath.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir)) {
        error = "Directory does not exist: " + dir.string();
        return false;
    }

    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        error = "Cannot create file: " + filename;
        return false;
    }

    std::ostringstream dict;
    dict << "{'descr': '<f4', 'fortran_order': False, 'shape': (" << points.rows << ", "
         << points.cols << "), }";
    std::string header = dict.str();

    // magic + version + 2-byte length + header + '\n' is padded to a multiple of 64
    const std::size_t preamble = kMagicSize + 2 + 2;
    const std::size_t unpadded = preamble + header.size() + 1;
    const std::size_t padding = (64 - unpadded % 64) % 64;
    header.append(padding, ' ');
    header.push_back('\n');

    const uint16_t header_len = static_cast<uint16_t>(header.size());
    const char version[2] = {1, 0};
    const char len_bytes[2] = {static_cast<char>(header_len & 0xFF),
                               static_cast<char>((header_len >> 8) & 0xFF)};

    file.write(kMagic, kMagicSize);
    file.write(version, 2);
    file.write(len_bytes, 2);
    file.write(header.data(), static_cast<std::streamsize>(header.size()));
    if (!points.values.empty()) {
        file.write(reinterpret_cast<const char*>(points.values.data()),
                   static_cast<std::streamsize>(points.values.size() * sizeof(float)));
    }

    if (!file.good()) {
        error = "Failed to write NPY data: " + filename;
        return false;
    }
    return true;
}

bool NpyIO::parseHeader(const std::string& filename, NpyHeader& header) {
    if (!std::filesystem::exists(filename)) {
        return false;
    }
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    std::string ignored;
    return parseHeaderInternal(file, header, ignored);
}

bool NpyIO::parseHeaderInternal(std::ifstream& file, NpyHeader& header, std::string& error) {
    char preamble[kMagicSize + 2] = {0};
    file.read(preamble, sizeof(preamble));
    if (file.gcount() != static_cast<std::streamsize>(sizeof(preamble)) ||
        !hasMagic(preamble, sizeof(preamble))) {
        error = "missing NPY magic";
        return false;
    }

    header.major_version = static_cast<unsigned char>(preamble[kMagicSize]);
    header.minor_version = static_cast<unsigned char>(preamble[kMagicSize + 1]);

    std::size_t header_len = 0;
    if (header.major_version == 1) {
        unsigned char len_bytes[2] = {0, 0};
        file.read(reinterpret_cast<char*>(len_bytes), 2);
        header_len = static_cast<std::size_t>(len_bytes[0]) |
                     (static_cast<std::size_t>(len_bytes[1]) << 8);
    } else if (header.major_version == 2 || header.major_version == 3) {
        unsigned char len_bytes[4] = {0, 0, 0, 0};
        file.read(reinterpret_cast<char*>(len_bytes), 4);
        header_len = static_cast<std::size_t>(len_bytes[0]) |
                     (static_cast<std::size_t>(len_bytes[1]) << 8) |
                     (static_cast<std::size_t>(len_bytes[2]) << 16) |
                     (static_cast<std::size_t>(len_bytes[3]) << 24);
    } else {
        error = "unsupported NPY version " + std::to_string(header.major_version);
        return false;
    }

    if (!file.good() || header_len == 0) {
        error = "invalid header length";
        return false;
    }

    std::string dict(header_len, '\0');
    file.read(&dict[0], static_cast<std::streamsize>(header_len));
    if (static_cast<std::size_t>(file.gcount()) != header_len) {
        error = "truncated header";
        return false;
    }

    return parseHeaderDict(dict, header, error);
}

bool NpyIO::parseHeaderDict(const std::string& dict, NpyHeader& header, std::string& error) {
    std::size_t pos = findKey(dict, "descr");
    if (pos == std::string::npos || pos >= dict.size()) {
        error = "header has no descr";
        return false;
    }
    const char quote = dict[pos];
    const std::size_t descr_end = dict.find(quote, pos + 1);
    if ((quote != '\'' && quote != '"') || descr_end == std::string::npos) {
        error = "structured dtypes are not supported";
        return false;
    }
    header.descr = dict.substr(pos + 1, descr_end - pos - 1);

    pos = findKey(dict, "fortran_order");
    if (pos == std::string::npos) {
        error = "header has no fortran_order";
        return false;
    }
    header.fortran_order = dict.compare(pos, 4, "True") == 0;

    pos = findKey(dict, "shape");
    if (pos == std::string::npos || pos >= dict.size() || dict[pos] != '(') {
        error = "header has no shape";
        return false;
    }
    const std::size_t shape_end = dict.find(')', pos);
    if (shape_end == std::string::npos) {
        error = "unterminated shape tuple";
        return false;
    }

    header.shape.clear();
    std::string dims = dict.substr(pos + 1, shape_end - pos - 1);
    std::istringstream iss(dims);
    std::string token;
    while (std::getline(iss, token, ',')) {
        const std::size_t first = token.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        const std::size_t last = token.find_last_not_of(" \tL");
        try {
            header.shape.push_back(
                static_cast<std::size_t>(std::stoull(token.substr(first, last - first + 1))));
        } catch (const std::exception&) {
            error = "invalid shape entry '" + token + "'";
            return false;
        }
    }

    if (header.itemSize() == 0) {
        error = "invalid descr '" + header.descr + "'";
        return false;
    }
    std::size_t payload_size = 0;
    if (!header.payloadBytes(payload_size)) {
        error = "shape too large";
        return false;
    }
    return true;
}

bool NpyIO::convertPayload(const std::vector<char>& raw, const NpyHeader& header,
                           std::vector<float>& out, std::string& error) {
    const char order = header.byteOrder();
    const std::size_t item_size = header.itemSize();
    if (order == '>' && item_size > 1) {
        error = "big-endian NPY arrays are not supported";
        return false;
    }

    std::size_t count = 0;
    if (!header.elementCount(count) || count * item_size != raw.size()) {
        error = "NPY payload size does not match its shape";
        return false;
    }
    switch (header.kind()) {
        case 'f':
            if (item_size == 4) {
                widenValues<float>(raw, count, out);
                return true;
            }
            if (item_size == 8) {
                widenValues<double>(raw, count, out);
                return true;
            }
            break;
        case 'i':
            switch (item_size) {
                case 1: widenValues<int8_t>(raw, count, out); return true;
                case 2: widenValues<int16_t>(raw, count, out); return true;
                case 4: widenValues<int32_t>(raw, count, out); return true;
                case 8: widenValues<int64_t>(raw, count, out); return true;
                default: break;
            }
            break;
        case 'u':
            switch (item_size) {
                case 1: widenValues<uint8_t>(raw, count, out); return true;
                case 2: widenValues<uint16_t>(raw, count, out); return true;
                case 4: widenValues<uint32_t>(raw, count, out); return true;
                case 8: widenValues<uint64_t>(raw, count, out); return true;
                default: break;
            }
            break;
        case 'b':
            if (item_size == 1) {
                widenValues<uint8_t>(raw, count, out);
                return true;
            }
            break;
        default:
            break;
    }

    error = "unsupported NPY dtype '" + header.descr + "'";
    return false;
}

}  // namespace pointcloud_dataset
