// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_UTILS_ERROR_ACCUMULATOR_HPP
#define POINTCLOUD_DATASET_UTILS_ERROR_ACCUMULATOR_HPP

#include <string>
#include <vector>

namespace pointcloud_dataset::utils {

class ErrorAccumulator {
public:
    void add(const std::string& message) {
        if (message.empty()) {
            return;
        }
        if (!messages_.empty()) {
            messages_ += "; ";
        }
        messages_ += message;
    }

    void addAll(const std::vector<std::string>& messages) {
        for (const auto& message : messages) {
            add(message);
        }
    }

    bool empty() const {
        return messages_.empty();
    }

    const std::string& str() const {
        return messages_;
    }

    void clear() {
        messages_.clear();
    }

    // Throws ExceptionT carrying all accumulated messages, if any.
    template <typename ExceptionT>
    void throwIfAny(const std::string& prefix) const {
        if (!messages_.empty()) {
            throw ExceptionT(prefix + messages_);
        }
    }

private:
    std::string messages_;
};

}  // namespace pointcloud_dataset::utils

#endif  // POINTCLOUD_DATASET_UTILS_ERROR_ACCUMULATOR_HPP
