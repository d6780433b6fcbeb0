// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>

#include "pointcloud_dataset/io/NpyIO.hpp"

namespace fs = std::filesystem;
using pointcloud_dataset::NpyHeader;
using pointcloud_dataset::NpyIO;
using pointcloud_dataset::PointArray;

class NpyIOTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = std::string(TEST_DATA_DIR) + "/npy_temp";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    // Writes a version 1.0 file with the given header dict and raw payload.
    void writeRawNpy(const std::string& filename, const std::string& dict, const void* payload,
                     std::size_t payload_size) {
        std::string header = dict;
        const std::size_t unpadded = 10 + header.size() + 1;
        header.append((64 - unpadded % 64) % 64, ' ');
        header.push_back('\n');

        std::ofstream file(filename, std::ios::binary);
        file.write("\x93NUMPY", 6);
        const char version[2] = {1, 0};
        file.write(version, 2);
        const uint16_t len = static_cast<uint16_t>(header.size());
        const char len_bytes[2] = {static_cast<char>(len & 0xFF), static_cast<char>(len >> 8)};
        file.write(len_bytes, 2);
        file.write(header.data(), static_cast<std::streamsize>(header.size()));
        file.write(static_cast<const char*>(payload), static_cast<std::streamsize>(payload_size));
    }

    std::string temp_dir;
};

TEST_F(NpyIOTest, WriteThenReadFloatArray) {
    PointArray points(3, 6);
    for (std::size_t i = 0; i < points.values.size(); ++i) {
        points.values[i] = 0.5f * static_cast<float>(i);
    }

    const std::string path = temp_dir + "/cloud.npy";
    std::string error;
    ASSERT_TRUE(NpyIO::writeNpyFile(path, points, error)) << error;

    // Payload must start on a 64-byte boundary
    NpyHeader header;
    ASSERT_TRUE(NpyIO::parseHeader(path, header));
    EXPECT_EQ(1, header.major_version);
    EXPECT_EQ("<f4", header.descr);
    EXPECT_FALSE(header.fortran_order);
    EXPECT_EQ((std::vector<std::size_t>{3, 6}), header.shape);
    EXPECT_EQ(0u, (fs::file_size(path) - points.values.size() * sizeof(float)) % 64);

    PointArray loaded;
    ASSERT_TRUE(NpyIO::readNpyFile(path, loaded, error)) << error;
    EXPECT_EQ(3u, loaded.rows);
    EXPECT_EQ(6u, loaded.cols);
    EXPECT_EQ(points.values, loaded.values);
}

TEST_F(NpyIOTest, ReadsFloat64AsFloat) {
    const double values[4] = {1.5, -2.25, 3.0, 4.125};
    const std::string path = temp_dir + "/f8.npy";
    writeRawNpy(path, "{'descr': '<f8', 'fortran_order': False, 'shape': (2, 2), }", values,
                sizeof(values));

    PointArray points;
    std::string error;
    ASSERT_TRUE(NpyIO::readNpyFile(path, points, error)) << error;
    EXPECT_EQ((std::vector<float>{1.5f, -2.25f, 3.0f, 4.125f}), points.values);
}

TEST_F(NpyIOTest, ReadsIntegerColumns) {
    const int32_t values[3] = {-1, 0, 7};
    const std::string path = temp_dir + "/i4.npy";
    writeRawNpy(path, "{'descr': '<i4', 'fortran_order': False, 'shape': (3,), }", values,
                sizeof(values));

    PointArray points;
    std::string error;
    ASSERT_TRUE(NpyIO::readNpyFile(path, points, error)) << error;
    EXPECT_EQ(3u, points.rows);
    EXPECT_EQ(1u, points.cols);
    EXPECT_EQ((std::vector<float>{-1.0f, 0.0f, 7.0f}), points.values);
}

TEST_F(NpyIOTest, TransposesFortranOrder) {
    // Column-major storage of [[1, 2, 3], [4, 5, 6]]
    const float values[6] = {1.f, 4.f, 2.f, 5.f, 3.f, 6.f};
    const std::string path = temp_dir + "/fortran.npy";
    writeRawNpy(path, "{'descr': '<f4', 'fortran_order': True, 'shape': (2, 3), }", values,
                sizeof(values));

    PointArray points;
    std::string error;
    ASSERT_TRUE(NpyIO::readNpyFile(path, points, error)) << error;
    EXPECT_EQ((std::vector<float>{1.f, 2.f, 3.f, 4.f, 5.f, 6.f}), points.values);
}

TEST_F(NpyIOTest, RejectsBigEndian) {
    const float values[2] = {1.f, 2.f};
    const std::string path = temp_dir + "/be.npy";
    writeRawNpy(path, "{'descr': '>f4', 'fortran_order': False, 'shape': (1, 2), }", values,
                sizeof(values));

    PointArray points;
    std::string error;
    EXPECT_FALSE(NpyIO::readNpyFile(path, points, error));
    EXPECT_NE(std::string::npos, error.find("big-endian"));
}

TEST_F(NpyIOTest, RejectsTruncatedPayload) {
    const float values[2] = {1.f, 2.f};
    const std::string path = temp_dir + "/short.npy";
    writeRawNpy(path, "{'descr': '<f4', 'fortran_order': False, 'shape': (4, 3), }", values,
                sizeof(values));

    PointArray points;
    std::string error;
    EXPECT_FALSE(NpyIO::readNpyFile(path, points, error));
    EXPECT_NE(std::string::npos, error.find("Truncated"));
}

TEST_F(NpyIOTest, RejectsShapeWhoseSizeOverflows) {
    const float values[4] = {1.f, 2.f, 3.f, 4.f};
    const std::string path = temp_dir + "/huge.npy";
    writeRawNpy(path, "{'descr': '<f4', 'fortran_order': False, 'shape': (4611686018427387905, 4), }",
                values, sizeof(values));

    PointArray points;
    std::string error;
    EXPECT_FALSE(NpyIO::readNpyFile(path, points, error));
    EXPECT_NE(std::string::npos, error.find("shape too large"));
    EXPECT_TRUE(points.empty());

    NpyHeader header;
    EXPECT_FALSE(NpyIO::parseHeader(path, header));
}

TEST_F(NpyIOTest, RejectsThreeDimensionalArrays) {
    const float values[8] = {0.f};
    const std::string path = temp_dir + "/cube.npy";
    writeRawNpy(path, "{'descr': '<f4', 'fortran_order': False, 'shape': (2, 2, 2), }", values,
                sizeof(values));

    PointArray points;
    std::string error;
    EXPECT_FALSE(NpyIO::readNpyFile(path, points, error));
}

TEST_F(NpyIOTest, RejectsMissingAndNonNpyFiles) {
    PointArray points;
    std::string error;
    EXPECT_FALSE(NpyIO::readNpyFile(temp_dir + "/missing.npy", points, error));
    EXPECT_NE(std::string::npos, error.find("does not exist"));

    const std::string text = temp_dir + "/text.npy";
    std::ofstream(text) << "hello world";
    EXPECT_FALSE(NpyIO::readNpyFile(text, points, error));
}

TEST_F(NpyIOTest, WriteFailsForMissingDirectory) {
    PointArray points(1, 3);
    std::string error;
    EXPECT_FALSE(NpyIO::writeNpyFile(temp_dir + "/no/such/dir/out.npy", points, error));
    EXPECT_FALSE(error.empty());
}
