// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_COMMON_DATASET_ERRORS_HPP
#define POINTCLOUD_DATASET_COMMON_DATASET_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace pointcloud_dataset {

class DatasetError : public std::runtime_error {
public:
    explicit DatasetError(const std::string& message) : std::runtime_error(message) {}
};

// Bad or missing directory structure, empty class, train/test class mismatch.
class CatalogError : public DatasetError {
public:
    explicit CatalogError(const std::string& message) : DatasetError(message) {}
};

// Malformed omission ranges, mismatched categorical lists, invalid sizes.
class ConfigError : public DatasetError {
public:
    explicit ConfigError(const std::string& message) : DatasetError(message) {}
};

class ResampleError : public DatasetError {
public:
    explicit ResampleError(const std::string& message) : DatasetError(message) {}
};

// Batch requested after the epoch was exhausted without a reset().
class IterationError : public DatasetError {
public:
    explicit IterationError(const std::string& message) : DatasetError(message) {}
};

// Unreadable sample file or sample content that does not fit the pipeline layout.
class SampleError : public DatasetError {
public:
    explicit SampleError(const std::string& message) : DatasetError(message) {}
};

}  // namespace pointcloud_dataset

#endif  // POINTCLOUD_DATASET_COMMON_DATASET_ERRORS_HPP
