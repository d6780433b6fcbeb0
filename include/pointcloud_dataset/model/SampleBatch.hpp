// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_MODEL_SAMPLE_BATCH_HPP
#define POINTCLOUD_DATASET_MODEL_SAMPLE_BATCH_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pointcloud_dataset {

// Stacked batch of fixed-size samples. data is (batch_size, num_points,
// num_channels) in row-major order.
struct SampleBatch {
    std::size_t batch_size = 0;
    std::size_t num_points = 0;
    std::size_t num_channels = 0;
    std::vector<float> data;
    std::vector<int32_t> labels;
    std::vector<float> weights;

    SampleBatch() = default;
    SampleBatch(std::size_t b, std::size_t k, std::size_t c)
        : batch_size(b), num_points(k), num_channels(c),
          data(b * k * c, 0.0f), labels(b, 0), weights(b, 0.0f) {}

    float* point(std::size_t example, std::size_t point_index) {
        return data.data() + (example * num_points + point_index) * num_channels;
    }
    const float* point(std::size_t example, std::size_t point_index) const {
        return data.data() + (example * num_points + point_index) * num_channels;
    }

    float* example(std::size_t b) { return point(b, 0); }
    const float* example(std::size_t b) const { return point(b, 0); }

    std::size_t exampleStride() const { return num_points * num_channels; }
};

}  // namespace pointcloud_dataset

#endif  // POINTCLOUD_DATASET_MODEL_SAMPLE_BATCH_HPP
