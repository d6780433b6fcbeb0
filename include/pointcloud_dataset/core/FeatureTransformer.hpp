// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef POINTCLOUD_DATASET_CORE_FEATURE_TRANSFORMER_HPP
#define POINTCLOUD_DATASET_CORE_FEATURE_TRANSFORMER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "pointcloud_dataset/model/PointArray.hpp"

namespace pointcloud_dataset {

struct TransformOptions {
    // Flat [start0, end0, start1, end1, ...] column ranges, applied last pair first.
    std::vector<int> omit_parameter_ranges;
    // Parallel lists: column index (in the progressively widened layout) and one-hot width.
    std::vector<int> categorical_indexes;
    std::vector<int> categorical_sizes;
    bool append_positional_channel = true;
    bool normalize = true;
    bool include_normals = true;

    std::vector<std::string> validate() const;
};

enum class StepKind {
    OmitRange,
    ExpandCategorical,
    AppendPosition,
    Normalize,
    KeepXyz
};

// One layout-changing stage. `first`/`second` are [start, end) for OmitRange
// and (column, width) for ExpandCategorical; unused otherwise.
struct TransformStep {
    StepKind kind;
    std::size_t first = 0;
    std::size_t second = 0;

    // Throws SampleError if the step cannot apply to input_width channels.
    std::size_t outputWidth(std::size_t input_width) const;
    void apply(PointArray& points) const;
    std::string describe() const;
};

void omitColumns(PointArray& points, std::size_t start, std::size_t end);
void expandCategorical(PointArray& points, std::size_t column, std::size_t width);
void appendPositionalChannel(PointArray& points);
void normalizeToUnitSphere(PointArray& points);
void keepLeadingColumns(PointArray& points, std::size_t count);

// Ordered per-sample transform chain. Range omission runs once at decode time
// (its result is what the cache stores); the remaining steps run on every
// resampled sample.
class FeatureTransformer {
public:
    // Throws ConfigError on malformed options.
    explicit FeatureTransformer(const TransformOptions& options);

    const std::vector<TransformStep>& decodeSteps() const { return decode_steps_; }
    const std::vector<TransformStep>& sampleSteps() const { return sample_steps_; }

    void applyDecodeSteps(PointArray& points) const;
    void applySampleSteps(PointArray& points) const;

    std::size_t decodedWidth(std::size_t raw_width) const;
    std::size_t outputWidth(std::size_t decoded_width) const;

private:
    std::vector<TransformStep> decode_steps_;
    std::vector<TransformStep> sample_steps_;
};

}  // namespace pointcloud_dataset

#endif  // POINTCLOUD_DATASET_CORE_FEATURE_TRANSFORMER_HPP
