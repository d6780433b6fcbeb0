// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_CORE_POINTCLOUD_DATASET_HPP
#define POINTCLOUD_DATASET_CORE_POINTCLOUD_DATASET_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "pointcloud_dataset/core/BatchAugmenter.hpp"
#include "pointcloud_dataset/core/BatchIterator.hpp"
#include "pointcloud_dataset/core/ClassCatalog.hpp"
#include "pointcloud_dataset/core/FeatureTransformer.hpp"
#include "pointcloud_dataset/core/SampleCache.hpp"
#include "pointcloud_dataset/model/PointArray.hpp"
#include "pointcloud_dataset/model/SampleBatch.hpp"

namespace pointcloud_dataset {

struct DatasetOptions {
    std::string root;
    Split split = Split::Train;
    std::size_t batch_size = 32;
    std::size_t num_points = 1024;
    bool normalize = true;
    bool include_normals = true;
    std::size_t cache_size = 15000;
    // Unset: shuffle the train split, keep the test split in catalog order.
    std::optional<bool> shuffle;
    bool shuffle_points = false;
    float scale_low = 0.7f;
    float scale_high = 1.3f;
    float shift_range = 0.3f;
    float jitter_sigma = 0.005f;
    float jitter_clip = 0.1f;
    bool append_positional_channel = true;
    std::vector<int> omit_parameter_ranges;
    std::vector<int> categorical_indexes;
    std::vector<int> categorical_sizes;
    // Unset: seeded from std::random_device.
    std::optional<uint32_t> seed;
    bool verbose = false;

    bool shuffleEnabled() const;
    TransformOptions transformOptions() const;
    AugmentationOptions augmentationOptions() const;

    std::vector<std::string> validate() const;
};

struct SampleItem {
    PointArray points;
    int32_t label = 0;
};

// Batching pipeline over one split of a class-per-directory point-cloud
// dataset: catalog -> cache -> resample -> transform -> stack -> augment.
//
// Construction validates the options, scans the catalog and decodes sample 0
// to fix the output channel count, so configuration problems surface before
// the first batch. reset() must be called at the start of every epoch.
class PointCloudDataset {
public:
    explicit PointCloudDataset(const DatasetOptions& options);

    const std::vector<std::string>& classNames() const { return catalog_.classNames(); }
    std::size_t numClasses() const { return catalog_.numClasses(); }
    std::size_t numChannels() const { return num_channels_; }
    std::size_t decodedWidth() const { return decoded_width_; }
    std::size_t numPoints() const { return options_.num_points; }
    std::size_t size() const { return catalog_.numSamples(); }
    std::size_t numBatches() const { return iterator_.numBatches(); }
    const std::vector<float>& classWeights() const { return weights_; }

    const ClassCatalog& catalog() const { return catalog_; }
    const DatasetOptions& options() const { return options_; }
    const FeatureTransformer& transformer() const { return transformer_; }
    const SampleCache& cache() const { return cache_; }
    const BatchIterator& iterator() const { return iterator_; }

    void reset();
    bool hasNextBatch() const { return iterator_.hasNext(); }
    IteratorState state() const { return iterator_.state(); }

    // Throws IterationError when called on an exhausted epoch. The cursor only
    // moves once the batch is assembled, so a failed sample leaves the same
    // batch pending.
    SampleBatch nextBatch(bool augment = false);

    // One resampled, transformed (num_points x numChannels()) sample.
    SampleItem getItem(std::size_t index);

private:
    DecodedSample decode(std::size_t index) const;

    DatasetOptions options_;
    ClassCatalog catalog_;
    std::vector<float> weights_;
    FeatureTransformer transformer_;
    BatchAugmenter augmenter_;
    SampleCache cache_;
    BatchIterator iterator_;
    std::mt19937 rng_;
    std::size_t decoded_width_ = 0;
    std::size_t num_channels_ = 0;
};

}  // namespace pointcloud_dataset

#endif  // POINTCLOUD_DATASET_CORE_POINTCLOUD_DATASET_HPP
