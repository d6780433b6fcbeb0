// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_MODEL_POINT_ARRAY_HPP
#define POINTCLOUD_DATASET_MODEL_POINT_ARRAY_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pointcloud_dataset {

// Row-major (points x channels) float matrix. Channel layout before any
// transformation: x, y, z [, nx, ny, nz] [, extra attributes...].
struct PointArray {
    std::size_t rows = 0;
    std::size_t cols = 0;
    std::vector<float> values;

    PointArray() = default;
    PointArray(std::size_t rows_, std::size_t cols_, float fill = 0.0f)
        : rows(rows_), cols(cols_), values(rows_ * cols_, fill) {}

    float& at(std::size_t row, std::size_t col) { return values[row * cols + col]; }
    float at(std::size_t row, std::size_t col) const { return values[row * cols + col]; }

    float* row(std::size_t r) { return values.data() + r * cols; }
    const float* row(std::size_t r) const { return values.data() + r * cols; }

    bool empty() const { return rows == 0; }
    void clear() {
        rows = 0;
        cols = 0;
        values.clear();
    }
};

struct DecodedSample {
    PointArray points;
    int32_t label = 0;
};

}  // namespace pointcloud_dataset

#endif  // POINTCLOUD_DATASET_MODEL_POINT_ARRAY_HPP
