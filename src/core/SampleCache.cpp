// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "pointcloud_dataset/core/SampleCache.hpp"

#include <utility>

namespace pointcloud_dataset {

SampleCache::SampleCache(std::size_t capacity, Decoder decoder)
    : capacity_(capacity), decoder_(std::move(decoder)) {}

SampleCache::SamplePtr SampleCache::getOrDecode(std::size_t index) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(index);
        if (it != entries_.end()) {
            ++hits_;
            return it->second;
        }
        ++misses_;
    }

    // Decoding happens outside the lock; only the capacity check and insert are serialized.
    auto sample = std::make_shared<const DecodedSample>(decoder_(index));

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(index);
    if (it != entries_.end()) {
        return it->second;
    }
    if (entries_.size() < capacity_) {
        entries_.emplace(index, sample);
    }
    return sample;
}

bool SampleCache::contains(std::size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(index) != 0;
}

std::size_t SampleCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t SampleCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

std::size_t SampleCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

}  // namespace pointcloud_dataset
