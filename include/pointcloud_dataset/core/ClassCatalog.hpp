// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_CORE_CLASS_CATALOG_HPP
#define POINTCLOUD_DATASET_CORE_CLASS_CATALOG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace pointcloud_dataset {

enum class Split {
    Train,
    Test
};

std::string splitToString(Split split);
bool parseSplit(const std::string& text, Split& split);

struct SamplePath {
    std::string class_name;
    std::string file_path;
};

// Compound ordering for class names of the form "<prefix>.<number>[...]":
// prefix compared as text, then the number compared numerically. Names
// without a numeric second token sort before numbered ones of the same prefix.
bool classNameLess(const std::string& lhs, const std::string& rhs);

class ClassCatalog {
public:
    // Scans <root>/<class>/<split>/* for sample files. Throws CatalogError.
    static ClassCatalog scan(const std::string& root, Split split);

    ClassCatalog(Split split, std::vector<std::string> class_names, std::vector<SamplePath> samples);

    // Throws CatalogError if the two catalogs disagree on class names.
    static void verifyCompatible(const ClassCatalog& train, const ClassCatalog& test);

    Split split() const { return split_; }

    const std::vector<std::string>& classNames() const { return class_names_; }
    std::size_t numClasses() const { return class_names_.size(); }
    int32_t classId(const std::string& class_name) const;

    const std::vector<SamplePath>& samples() const { return samples_; }
    std::size_t numSamples() const { return samples_.size(); }
    const SamplePath& sample(std::size_t index) const { return samples_.at(index); }
    int32_t label(std::size_t index) const { return labels_.at(index); }

    // Number of samples per class id.
    std::vector<std::size_t> classCounts() const;

private:
    Split split_;
    std::vector<std::string> class_names_;
    std::map<std::string, int32_t> class_ids_;
    std::vector<SamplePath> samples_;
    std::vector<int32_t> labels_;
};

}  // namespace pointcloud_dataset

#endif  // POINTCLOUD_DATASET_CORE_CLASS_CATALOG_HPP
