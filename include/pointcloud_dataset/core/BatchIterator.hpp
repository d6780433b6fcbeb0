// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_CORE_BATCH_ITERATOR_HPP
#define POINTCLOUD_DATASET_CORE_BATCH_ITERATOR_HPP

#include <cstddef>
#include <random>
#include <vector>

namespace pointcloud_dataset {

enum class IteratorState {
    Fresh,
    Iterating,
    Exhausted
};

// Epoch bookkeeping over sample indices [0, total). Holds the permutation and
// batch cursor; knows nothing about sample contents.
class BatchIterator {
public:
    BatchIterator(std::size_t total, std::size_t batch_size, bool shuffle);

    // New permutation (shuffled or identity), cursor back to zero.
    void reset(std::mt19937& rng);

    bool hasNext() const { return cursor_ < num_batches_; }

    // Sample indices of the current batch; the last one may be short.
    // Throws IterationError once the epoch is exhausted.
    std::vector<std::size_t> next();

    // Same indices as next() without moving the cursor.
    std::vector<std::size_t> peek() const;
    void advance();

    IteratorState state() const;

    std::size_t numBatches() const { return num_batches_; }
    std::size_t cursor() const { return cursor_; }
    std::size_t total() const { return total_; }
    std::size_t batchSize() const { return batch_size_; }
    bool shuffles() const { return shuffle_; }
    const std::vector<std::size_t>& permutation() const { return permutation_; }

private:
    std::size_t total_;
    std::size_t batch_size_;
    bool shuffle_;
    std::vector<std::size_t> permutation_;
    std::size_t num_batches_ = 0;
    std::size_t cursor_ = 0;
};

}  // namespace pointcloud_dataset

#endif  // POINTCLOUD_DATASET_CORE_BATCH_ITERATOR_HPP
