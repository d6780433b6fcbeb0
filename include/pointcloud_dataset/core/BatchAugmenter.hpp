// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_CORE_BATCH_AUGMENTER_HPP
#define POINTCLOUD_DATASET_CORE_BATCH_AUGMENTER_HPP

#include <array>
#include <random>
#include <string>
#include <vector>

#include "pointcloud_dataset/model/SampleBatch.hpp"

namespace pointcloud_dataset {

struct AugmentationOptions {
    float scale_low = 0.7f;
    float scale_high = 1.3f;
    float shift_range = 0.3f;
    float jitter_sigma = 0.005f;
    float jitter_clip = 0.1f;
    float perturbation_sigma = 0.06f;
    float perturbation_clip = 0.18f;
    bool rotate_normals = true;
    bool shuffle_points = false;

    std::vector<std::string> validate() const;
};

using Matrix3 = std::array<std::array<float, 3>, 3>;

// Geometric augmentation of a whole stacked batch. Every stage draws its
// parameters independently per example. Shape is never changed.
class BatchAugmenter {
public:
    explicit BatchAugmenter(const AugmentationOptions& options);

    // Runs rotation, perturbation, scale, shift, jitter and (optionally) point
    // shuffling in that order.
    void augment(SampleBatch& batch, std::mt19937& rng) const;

    void rotateAboutVerticalAxis(SampleBatch& batch, std::mt19937& rng) const;
    void perturbRotation(SampleBatch& batch, std::mt19937& rng) const;
    void scale(SampleBatch& batch, std::mt19937& rng) const;
    void shift(SampleBatch& batch, std::mt19937& rng) const;
    void jitter(SampleBatch& batch, std::mt19937& rng) const;
    void shufflePoints(SampleBatch& batch, std::mt19937& rng) const;

    // Multiplies position rows (and normal rows, when enabled and present) of
    // one example by `rotation` as row vectors.
    void applyRotation(SampleBatch& batch, std::size_t example, const Matrix3& rotation) const;

    bool rotatesNormals(const SampleBatch& batch) const;

    const AugmentationOptions& options() const { return options_; }

private:
    AugmentationOptions options_;
};

}  // namespace pointcloud_dataset

#endif  // POINTCLOUD_DATASET_CORE_BATCH_AUGMENTER_HPP
