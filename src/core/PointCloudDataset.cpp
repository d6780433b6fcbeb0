// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "pointcloud_dataset/core/PointCloudDataset.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>

#include "pointcloud_dataset/common/DatasetErrors.hpp"
#include "pointcloud_dataset/core/ClassWeights.hpp"
#include "pointcloud_dataset/core/PointResampler.hpp"
#include "pointcloud_dataset/io/SampleIO.hpp"
#include "pointcloud_dataset/utils/ErrorAccumulator.hpp"

namespace pointcloud_dataset {

namespace {

const DatasetOptions& checkedOptions(const DatasetOptions& options) {
    utils::ErrorAccumulator errors;
    errors.addAll(options.validate());
    errors.throwIfAny<ConfigError>("Invalid dataset options: ");
    return options;
}

std::mt19937 makeEngine(const std::optional<uint32_t>& seed) {
    if (seed) {
        return std::mt19937(*seed);
    }
    std::random_device rd;
    return std::mt19937(rd());
}

}  // namespace

bool DatasetOptions::shuffleEnabled() const {
    if (shuffle) {
        return *shuffle;
    }
    return split == Split::Train;
}

TransformOptions DatasetOptions::transformOptions() const {
    TransformOptions transform;
    transform.omit_parameter_ranges = omit_parameter_ranges;
    transform.categorical_indexes = categorical_indexes;
    transform.categorical_sizes = categorical_sizes;
    transform.append_positional_channel = append_positional_channel;
    transform.normalize = normalize;
    transform.include_normals = include_normals;
    return transform;
}

AugmentationOptions DatasetOptions::augmentationOptions() const {
    AugmentationOptions augmentation;
    augmentation.scale_low = scale_low;
    augmentation.scale_high = scale_high;
    augmentation.shift_range = shift_range;
    augmentation.jitter_sigma = jitter_sigma;
    augmentation.jitter_clip = jitter_clip;
    augmentation.rotate_normals = include_normals;
    augmentation.shuffle_points = shuffle_points;
    return augmentation;
}

std::vector<std::string> DatasetOptions::validate() const {
    std::vector<std::string> errors;
    if (root.empty()) {
        errors.emplace_back("root is empty");
    }
    if (batch_size == 0) {
        errors.emplace_back("batch_size must be greater than zero");
    }
    if (num_points == 0) {
        errors.emplace_back("num_points must be greater than zero");
    }
    for (auto& error : transformOptions().validate()) {
        errors.push_back(std::move(error));
    }
    for (auto& error : augmentationOptions().validate()) {
        errors.push_back(std::move(error));
    }
    return errors;
}

PointCloudDataset::PointCloudDataset(const DatasetOptions& options)
    : options_(checkedOptions(options)),
      catalog_(ClassCatalog::scan(options_.root, options_.split)),
      weights_(computeClassWeights(catalog_)),
      transformer_(options_.transformOptions()),
      augmenter_(options_.augmentationOptions()),
      cache_(options_.cache_size, [this](std::size_t index) { return decode(index); }),
      iterator_(catalog_.numSamples(), options_.batch_size, options_.shuffleEnabled()),
      rng_(makeEngine(options_.seed)) {
    auto t0 = std::chrono::high_resolution_clock::now();

    decoded_width_ = cache_.getOrDecode(0)->points.cols;
    num_channels_ = transformer_.outputWidth(decoded_width_);
    reset();

    if (options_.verbose) {
        auto t1 = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
        std::cout << "[PROFILE][PointCloudDataset] split=" << splitToString(options_.split)
                  << " classes=" << numClasses() << " samples=" << size()
                  << " channels=" << num_channels_ << " first_decode=" << ms << " ms" << std::endl;
    }
}

void PointCloudDataset::reset() {
    iterator_.reset(rng_);
}

SampleBatch PointCloudDataset::nextBatch(bool augment) {
    const std::vector<std::size_t> indices = iterator_.peek();

    SampleBatch batch(indices.size(), options_.num_points, num_channels_);
    const std::size_t stride = batch.exampleStride();
    for (std::size_t i = 0; i < indices.size(); ++i) {
        SampleItem item = getItem(indices[i]);
        std::copy(item.points.values.begin(), item.points.values.end(),
                  batch.data.begin() + static_cast<std::ptrdiff_t>(i * stride));
        batch.labels[i] = item.label;
        batch.weights[i] = weights_[static_cast<std::size_t>(item.label)];
    }

    if (augment) {
        augmenter_.augment(batch, rng_);
    }
    iterator_.advance();
    return batch;
}

SampleItem PointCloudDataset::getItem(std::size_t index) {
    auto sample = cache_.getOrDecode(index);
    const std::string& path = catalog_.sample(index).file_path;

    if (sample->points.cols != decoded_width_) {
        std::ostringstream oss;
        oss << "Sample " << path << " has " << sample->points.cols
            << " channels after omission, expected " << decoded_width_;
        throw SampleError(oss.str());
    }

    SampleItem item;
    item.label = sample->label;
    try {
        item.points = PointResampler::resample(sample->points, options_.num_points, rng_);
        transformer_.applySampleSteps(item.points);
    } catch (const ResampleError& e) {
        throw ResampleError(std::string(e.what()) + ": " + path);
    } catch (const SampleError& e) {
        throw SampleError(std::string(e.what()) + ": " + path);
    }
    return item;
}

DecodedSample PointCloudDataset::decode(std::size_t index) const {
    const SamplePath& sample_path = catalog_.sample(index);

    DecodedSample sample;
    std::string error;
    if (!SampleIO::loadSample(sample_path.file_path, sample.points, error)) {
        throw SampleError(error);
    }

    try {
        transformer_.applyDecodeSteps(sample.points);
    } catch (const SampleError& e) {
        throw SampleError(std::string(e.what()) + ": " + sample_path.file_path);
    }
    sample.label = catalog_.label(index);
    return sample;
}

}  // namespace pointcloud_dataset
