// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "pointcloud_dataset/core/BatchAugmenter.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

#include "pointcloud_dataset/common/DatasetErrors.hpp"
#include "pointcloud_dataset/utils/ErrorAccumulator.hpp"

namespace pointcloud_dataset {

namespace {

constexpr double kTwoPi = 6.283185307179586;

Matrix3 multiply(const Matrix3& a, const Matrix3& b) {
    Matrix3 out{};
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            float sum = 0.0f;
            for (int k = 0; k < 3; ++k) {
                sum += a[i][k] * b[k][j];
            }
            out[i][j] = sum;
        }
    }
    return out;
}

void rotateTriplet(float* values, const Matrix3& r) {
    const float x = values[0];
    const float y = values[1];
    const float z = values[2];
    values[0] = x * r[0][0] + y * r[1][0] + z * r[2][0];
    values[1] = x * r[0][1] + y * r[1][1] + z * r[2][1];
    values[2] = x * r[0][2] + y * r[1][2] + z * r[2][2];
}

float clipValue(float value, float clip) {
    return std::min(std::max(value, -clip), clip);
}

void requirePositions(const SampleBatch& batch) {
    if (batch.num_channels < 3) {
        throw SampleError("Augmentation needs x, y, z channels but batch has " +
                          std::to_string(batch.num_channels));
    }
}

}  // namespace

std::vector<std::string> AugmentationOptions::validate() const {
    std::vector<std::string> errors;
    if (scale_low <= 0.0f || scale_high <= 0.0f) {
        errors.emplace_back("scale_low and scale_high must be positive");
    }
    if (scale_low > scale_high) {
        errors.emplace_back("scale_low must not exceed scale_high");
    }
    if (shift_range < 0.0f) {
        errors.emplace_back("shift_range must be non-negative");
    }
    if (jitter_sigma < 0.0f) {
        errors.emplace_back("jitter_sigma must be non-negative");
    }
    if (jitter_clip < 0.0f) {
        errors.emplace_back("jitter_clip must be non-negative");
    }
    if (perturbation_sigma < 0.0f || perturbation_clip < 0.0f) {
        errors.emplace_back("perturbation_sigma and perturbation_clip must be non-negative");
    }
    return errors;
}

BatchAugmenter::BatchAugmenter(const AugmentationOptions& options) : options_(options) {
    utils::ErrorAccumulator errors;
    errors.addAll(options_.validate());
    errors.throwIfAny<ConfigError>("Invalid augmentation options: ");
}

void BatchAugmenter::augment(SampleBatch& batch, std::mt19937& rng) const {
    rotateAboutVerticalAxis(batch, rng);
    perturbRotation(batch, rng);
    scale(batch, rng);
    shift(batch, rng);
    jitter(batch, rng);
    if (options_.shuffle_points) {
        shufflePoints(batch, rng);
    }
}

bool BatchAugmenter::rotatesNormals(const SampleBatch& batch) const {
    return options_.rotate_normals && batch.num_channels >= 6;
}

void BatchAugmenter::applyRotation(SampleBatch& batch, std::size_t example,
                                   const Matrix3& rotation) const {
    requirePositions(batch);
    const bool with_normals = rotatesNormals(batch);
    for (std::size_t p = 0; p < batch.num_points; ++p) {
        float* values = batch.point(example, p);
        rotateTriplet(values, rotation);
        if (with_normals) {
            rotateTriplet(values + 3, rotation);
        }
    }
}

void BatchAugmenter::rotateAboutVerticalAxis(SampleBatch& batch, std::mt19937& rng) const {
    std::uniform_real_distribution<double> angle_dist(0.0, kTwoPi);
    for (std::size_t b = 0; b < batch.batch_size; ++b) {
        const double angle = angle_dist(rng);
        const float c = static_cast<float>(std::cos(angle));
        const float s = static_cast<float>(std::sin(angle));
        const Matrix3 rotation = {{{c, 0.0f, s},
                                   {0.0f, 1.0f, 0.0f},
                                   {-s, 0.0f, c}}};
        applyRotation(batch, b, rotation);
    }
}

void BatchAugmenter::perturbRotation(SampleBatch& batch, std::mt19937& rng) const {
    if (options_.perturbation_sigma <= 0.0f) {
        return;
    }
    std::normal_distribution<float> angle_dist(0.0f, options_.perturbation_sigma);
    for (std::size_t b = 0; b < batch.batch_size; ++b) {
        float angles[3];
        for (float& angle : angles) {
            angle = clipValue(angle_dist(rng), options_.perturbation_clip);
        }

        const float cx = std::cos(angles[0]), sx = std::sin(angles[0]);
        const float cy = std::cos(angles[1]), sy = std::sin(angles[1]);
        const float cz = std::cos(angles[2]), sz = std::sin(angles[2]);
        const Matrix3 rx = {{{1.0f, 0.0f, 0.0f}, {0.0f, cx, -sx}, {0.0f, sx, cx}}};
        const Matrix3 ry = {{{cy, 0.0f, sy}, {0.0f, 1.0f, 0.0f}, {-sy, 0.0f, cy}}};
        const Matrix3 rz = {{{cz, -sz, 0.0f}, {sz, cz, 0.0f}, {0.0f, 0.0f, 1.0f}}};

        applyRotation(batch, b, multiply(rz, multiply(ry, rx)));
    }
}

void BatchAugmenter::scale(SampleBatch& batch, std::mt19937& rng) const {
    requirePositions(batch);
    // A degenerate [1, 1] range is an exact identity
    if (options_.scale_low == 1.0f && options_.scale_high == 1.0f) {
        return;
    }

    std::uniform_real_distribution<float> scale_dist(options_.scale_low, options_.scale_high);
    for (std::size_t b = 0; b < batch.batch_size; ++b) {
        const float factor = options_.scale_low == options_.scale_high ? options_.scale_low
                                                                       : scale_dist(rng);
        for (std::size_t p = 0; p < batch.num_points; ++p) {
            float* values = batch.point(b, p);
            values[0] *= factor;
            values[1] *= factor;
            values[2] *= factor;
        }
    }
}

void BatchAugmenter::shift(SampleBatch& batch, std::mt19937& rng) const {
    requirePositions(batch);
    if (options_.shift_range <= 0.0f) {
        return;
    }
    std::uniform_real_distribution<float> shift_dist(-options_.shift_range, options_.shift_range);
    for (std::size_t b = 0; b < batch.batch_size; ++b) {
        const float offset[3] = {shift_dist(rng), shift_dist(rng), shift_dist(rng)};
        for (std::size_t p = 0; p < batch.num_points; ++p) {
            float* values = batch.point(b, p);
            values[0] += offset[0];
            values[1] += offset[1];
            values[2] += offset[2];
        }
    }
}

void BatchAugmenter::jitter(SampleBatch& batch, std::mt19937& rng) const {
    requirePositions(batch);
    if (options_.jitter_sigma <= 0.0f) {
        return;
    }
    std::normal_distribution<float> noise(0.0f, options_.jitter_sigma);
    for (std::size_t b = 0; b < batch.batch_size; ++b) {
        for (std::size_t p = 0; p < batch.num_points; ++p) {
            float* values = batch.point(b, p);
            for (int axis = 0; axis < 3; ++axis) {
                values[axis] += clipValue(noise(rng), options_.jitter_clip);
            }
        }
    }
}

void BatchAugmenter::shufflePoints(SampleBatch& batch, std::mt19937& rng) const {
    const std::size_t stride = batch.num_channels;
    std::vector<std::size_t> order(batch.num_points);
    std::vector<float> scratch(batch.exampleStride());
    for (std::size_t b = 0; b < batch.batch_size; ++b) {
        std::iota(order.begin(), order.end(), 0);
        std::shuffle(order.begin(), order.end(), rng);

        const float* src = batch.example(b);
        for (std::size_t p = 0; p < batch.num_points; ++p) {
            std::copy(src + order[p] * stride, src + (order[p] + 1) * stride,
                      scratch.begin() + static_cast<std::ptrdiff_t>(p * stride));
        }
        std::copy(scratch.begin(), scratch.end(), batch.example(b));
    }
}

}  // namespace pointcloud_dataset
