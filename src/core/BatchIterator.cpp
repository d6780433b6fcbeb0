// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "pointcloud_dataset/core/BatchIterator.hpp"

#include <algorithm>
#include <numeric>
#include <sstream>

#include "pointcloud_dataset/common/DatasetErrors.hpp"

namespace pointcloud_dataset {

BatchIterator::BatchIterator(std::size_t total, std::size_t batch_size, bool shuffle)
    : total_(total), batch_size_(batch_size), shuffle_(shuffle) {
    if (batch_size_ == 0) {
        throw ConfigError("batch_size must be greater than zero");
    }
}

void BatchIterator::reset(std::mt19937& rng) {
    permutation_.resize(total_);
    std::iota(permutation_.begin(), permutation_.end(), 0);
    if (shuffle_) {
        std::shuffle(permutation_.begin(), permutation_.end(), rng);
    }
    num_batches_ = (total_ + batch_size_ - 1) / batch_size_;
    cursor_ = 0;
}

std::vector<std::size_t> BatchIterator::next() {
    std::vector<std::size_t> indices = peek();
    advance();
    return indices;
}

std::vector<std::size_t> BatchIterator::peek() const {
    if (!hasNext()) {
        std::ostringstream oss;
        oss << "Batch " << cursor_ << " requested but the epoch has " << num_batches_
            << " batches; call reset() before the next epoch";
        throw IterationError(oss.str());
    }

    const std::size_t start = cursor_ * batch_size_;
    const std::size_t end = std::min(start + batch_size_, total_);
    return std::vector<std::size_t>(permutation_.begin() + static_cast<std::ptrdiff_t>(start),
                                    permutation_.begin() + static_cast<std::ptrdiff_t>(end));
}

void BatchIterator::advance() {
    if (!hasNext()) {
        throw IterationError("advance() called on an exhausted epoch");
    }
    ++cursor_;
}

IteratorState BatchIterator::state() const {
    if (cursor_ >= num_batches_) {
        return IteratorState::Exhausted;
    }
    return cursor_ == 0 ? IteratorState::Fresh : IteratorState::Iterating;
}

}  // namespace pointcloud_dataset
