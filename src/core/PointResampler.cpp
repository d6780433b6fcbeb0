// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "pointcloud_dataset/core/PointResampler.hpp"

#include <algorithm>
#include <cstring>
#include <iterator>
#include <numeric>

#include "pointcloud_dataset/common/DatasetErrors.hpp"

namespace pointcloud_dataset {

std::vector<std::size_t> PointResampler::drawIndices(std::size_t num_points, std::size_t target,
                                                     std::mt19937& rng) {
    if (num_points == 0) {
        throw ResampleError("Cannot resample an empty point set");
    }

    std::vector<std::size_t> indices;
    indices.reserve(target);

    if (num_points > target) {
        std::vector<std::size_t> all(num_points);
        std::iota(all.begin(), all.end(), 0);
        std::sample(all.begin(), all.end(), std::back_inserter(indices), target, rng);
    } else {
        std::uniform_int_distribution<std::size_t> pick(0, num_points - 1);
        for (std::size_t i = 0; i < target; ++i) {
            indices.push_back(pick(rng));
        }
    }

    std::sort(indices.begin(), indices.end());
    return indices;
}

PointArray PointResampler::resample(const PointArray& points, std::size_t target, std::mt19937& rng) {
    return gather(points, drawIndices(points.rows, target, rng));
}

PointArray PointResampler::gather(const PointArray& points, const std::vector<std::size_t>& indices) {
    PointArray out(indices.size(), points.cols);
    for (std::size_t i = 0; i < indices.size(); ++i) {
        std::memcpy(out.row(i), points.row(indices[i]), points.cols * sizeof(float));
    }
    return out;
}

}  // namespace pointcloud_dataset
