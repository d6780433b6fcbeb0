// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_CORE_SAMPLE_CACHE_HPP
#define POINTCLOUD_DATASET_CORE_SAMPLE_CACHE_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "pointcloud_dataset/model/PointArray.hpp"

namespace pointcloud_dataset {

// Bounded index -> decoded sample map. The first `capacity` distinct misses
// are stored; later misses are decoded and returned without being stored.
// Entries are never evicted or replaced.
class SampleCache {
public:
    using SamplePtr = std::shared_ptr<const DecodedSample>;
    using Decoder = std::function<DecodedSample(std::size_t)>;

    SampleCache(std::size_t capacity, Decoder decoder);

    SamplePtr getOrDecode(std::size_t index);

    bool contains(std::size_t index) const;
    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }

    std::size_t hits() const;
    std::size_t misses() const;

private:
    std::size_t capacity_;
    Decoder decoder_;
    mutable std::mutex mutex_;
    std::unordered_map<std::size_t, SamplePtr> entries_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
};

}  // namespace pointcloud_dataset

#endif  // POINTCLOUD_DATASET_CORE_SAMPLE_CACHE_HPP
