// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "pointcloud_dataset/core/ClassCatalog.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <tuple>

#include "pointcloud_dataset/common/DatasetErrors.hpp"
#include "pointcloud_dataset/io/SampleIO.hpp"

namespace pointcloud_dataset {

namespace {

struct ClassSortKey {
    std::string prefix;
    bool has_number = false;
    long long number = 0;
};

ClassSortKey makeSortKey(const std::string& name) {
    ClassSortKey key;
    const std::size_t first_dot = name.find('.');
    key.prefix = name.substr(0, first_dot);
    if (first_dot == std::string::npos) {
        return key;
    }

    const std::size_t second_dot = name.find('.', first_dot + 1);
    const std::string token = name.substr(first_dot + 1, second_dot == std::string::npos
                                                             ? std::string::npos
                                                             : second_dot - first_dot - 1);
    if (token.empty()) {
        return key;
    }
    try {
        std::size_t consumed = 0;
        long long value = std::stoll(token, &consumed);
        if (consumed == token.size()) {
            key.has_number = true;
            key.number = value;
        }
    } catch (const std::exception&) {
        key.has_number = false;
    }
    return key;
}

}  // namespace

std::string splitToString(Split split) {
    switch (split) {
        case Split::Train:
            return "train";
        case Split::Test:
            return "test";
    }
    return "unknown";
}

bool parseSplit(const std::string& text, Split& split) {
    if (text == "train") {
        split = Split::Train;
        return true;
    }
    if (text == "test") {
        split = Split::Test;
        return true;
    }
    return false;
}

bool classNameLess(const std::string& lhs, const std::string& rhs) {
    const ClassSortKey a = makeSortKey(lhs);
    const ClassSortKey b = makeSortKey(rhs);
    return std::tie(a.prefix, a.has_number, a.number, lhs) <
           std::tie(b.prefix, b.has_number, b.number, rhs);
}

ClassCatalog ClassCatalog::scan(const std::string& root, Split split) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw CatalogError("Dataset root is not a directory: " + root);
    }

    std::vector<std::string> class_names;
    for (const auto& entry : fs::directory_iterator(root)) {
        if (entry.is_directory()) {
            class_names.push_back(entry.path().filename().string());
        }
    }
    if (class_names.empty()) {
        throw CatalogError("Dataset root has no class directories: " + root);
    }

    const std::string split_name = splitToString(split);
    std::vector<SamplePath> samples;
    for (const auto& class_name : class_names) {
        const fs::path split_dir = fs::path(root) / class_name / split_name;
        std::size_t found = 0;
        if (fs::is_directory(split_dir, ec)) {
            for (const auto& entry : fs::directory_iterator(split_dir)) {
                if (!entry.is_regular_file() ||
                    !SampleIO::hasSupportedExtension(entry.path().string())) {
                    continue;
                }
                samples.push_back({class_name, entry.path().string()});
                ++found;
            }
        }
        if (found == 0) {
            throw CatalogError("Class '" + class_name + "' has no " + split_name +
                               " samples under " + split_dir.string());
        }
    }

    return ClassCatalog(split, std::move(class_names), std::move(samples));
}

ClassCatalog::ClassCatalog(Split split, std::vector<std::string> class_names,
                           std::vector<SamplePath> samples)
    : split_(split), class_names_(std::move(class_names)), samples_(std::move(samples)) {
    std::sort(class_names_.begin(), class_names_.end(), classNameLess);
    class_names_.erase(std::unique(class_names_.begin(), class_names_.end()), class_names_.end());

    for (std::size_t i = 0; i < class_names_.size(); ++i) {
        class_ids_[class_names_[i]] = static_cast<int32_t>(i);
    }

    std::sort(samples_.begin(), samples_.end(), [](const SamplePath& a, const SamplePath& b) {
        if (a.class_name != b.class_name) {
            return classNameLess(a.class_name, b.class_name);
        }
        return a.file_path < b.file_path;
    });

    labels_.reserve(samples_.size());
    for (const auto& sample : samples_) {
        labels_.push_back(classId(sample.class_name));
    }
}

int32_t ClassCatalog::classId(const std::string& class_name) const {
    auto it = class_ids_.find(class_name);
    if (it == class_ids_.end()) {
        throw CatalogError("Unknown class '" + class_name + "'");
    }
    return it->second;
}

std::vector<std::size_t> ClassCatalog::classCounts() const {
    std::vector<std::size_t> counts(class_names_.size(), 0);
    for (int32_t label : labels_) {
        ++counts[static_cast<std::size_t>(label)];
    }
    return counts;
}

void ClassCatalog::verifyCompatible(const ClassCatalog& train, const ClassCatalog& test) {
    if (train.numClasses() != test.numClasses()) {
        std::ostringstream oss;
        oss << "Class count mismatch between splits: " << splitToString(train.split()) << "="
            << train.numClasses() << ", " << splitToString(test.split()) << "=" << test.numClasses();
        throw CatalogError(oss.str());
    }
    for (std::size_t i = 0; i < train.numClasses(); ++i) {
        if (train.classNames()[i] != test.classNames()[i]) {
            throw CatalogError("Class name mismatch between splits at id " + std::to_string(i) +
                               ": '" + train.classNames()[i] + "' vs '" + test.classNames()[i] + "'");
        }
    }
}

}  // namespace pointcloud_dataset
