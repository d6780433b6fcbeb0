// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_CORE_POINT_RESAMPLER_HPP
#define POINTCLOUD_DATASET_CORE_POINT_RESAMPLER_HPP

#include <cstddef>
#include <random>
#include <vector>

#include "pointcloud_dataset/model/PointArray.hpp"

namespace pointcloud_dataset {

// Uniform random resampling to a fixed point count. Kept indices are always
// ascending so the original point order survives resampling.
class PointResampler {
public:
    // N > K: K distinct indices. N <= K: K indices drawn with replacement.
    // Throws ResampleError when N == 0.
    static std::vector<std::size_t> drawIndices(std::size_t num_points, std::size_t target,
                                                std::mt19937& rng);

    static PointArray resample(const PointArray& points, std::size_t target, std::mt19937& rng);

    static PointArray gather(const PointArray& points, const std::vector<std::size_t>& indices);
};

}  // namespace pointcloud_dataset

#endif  // POINTCLOUD_DATASET_CORE_POINT_RESAMPLER_HPP
