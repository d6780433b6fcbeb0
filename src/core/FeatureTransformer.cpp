// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "pointcloud_dataset/core/FeatureTransformer.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "pointcloud_dataset/common/DatasetErrors.hpp"
#include "pointcloud_dataset/utils/ErrorAccumulator.hpp"

namespace pointcloud_dataset {

namespace {

std::string widthError(const TransformStep& step, std::size_t input_width) {
    std::ostringstream oss;
    oss << step.describe() << " cannot apply to " << input_width << " channels";
    return oss.str();
}

}  // namespace

std::vector<std::string> TransformOptions::validate() const {
    std::vector<std::string> errors;
    if (omit_parameter_ranges.size() % 2 != 0) {
        errors.emplace_back("omit_parameter_ranges must contain an even number of values");
    } else {
        for (std::size_t i = 0; i < omit_parameter_ranges.size(); i += 2) {
            const int start = omit_parameter_ranges[i];
            const int end = omit_parameter_ranges[i + 1];
            if (start < 0 || end < 0) {
                errors.emplace_back("omit_parameter_ranges entries must be non-negative");
            } else if (start > end) {
                errors.emplace_back("omit_parameter_ranges pair [" + std::to_string(start) + ", " +
                                    std::to_string(end) + ") has start greater than end");
            }
        }
        for (std::size_t i = 0; i < omit_parameter_ranges.size(); i += 2) {
            for (std::size_t j = i + 2; j < omit_parameter_ranges.size(); j += 2) {
                if (omit_parameter_ranges[i] < omit_parameter_ranges[j + 1] &&
                    omit_parameter_ranges[j] < omit_parameter_ranges[i + 1]) {
                    errors.emplace_back("omit_parameter_ranges pairs must not overlap");
                    break;
                }
            }
        }
    }

    if (categorical_indexes.size() != categorical_sizes.size()) {
        errors.emplace_back("categorical_indexes and categorical_sizes must have the same length");
    }
    for (int index : categorical_indexes) {
        if (index < 0) {
            errors.emplace_back("categorical_indexes entries must be non-negative");
            break;
        }
    }
    for (int size : categorical_sizes) {
        if (size <= 0) {
            errors.emplace_back("categorical_sizes entries must be greater than zero");
            break;
        }
    }
    return errors;
}

std::size_t TransformStep::outputWidth(std::size_t input_width) const {
    switch (kind) {
        case StepKind::OmitRange:
            if (second > input_width) {
                throw SampleError(widthError(*this, input_width));
            }
            return input_width - (second - first);
        case StepKind::ExpandCategorical:
            if (first >= input_width) {
                throw SampleError(widthError(*this, input_width));
            }
            return input_width - 1 + second;
        case StepKind::AppendPosition:
            return input_width + 1;
        case StepKind::Normalize:
            if (input_width < 3) {
                throw SampleError(widthError(*this, input_width));
            }
            return input_width;
        case StepKind::KeepXyz:
            if (input_width < 3) {
                throw SampleError(widthError(*this, input_width));
            }
            return 3;
    }
    return input_width;
}

void TransformStep::apply(PointArray& points) const {
    outputWidth(points.cols);
    switch (kind) {
        case StepKind::OmitRange:
            omitColumns(points, first, second);
            break;
        case StepKind::ExpandCategorical:
            expandCategorical(points, first, second);
            break;
        case StepKind::AppendPosition:
            appendPositionalChannel(points);
            break;
        case StepKind::Normalize:
            normalizeToUnitSphere(points);
            break;
        case StepKind::KeepXyz:
            keepLeadingColumns(points, 3);
            break;
    }
}

std::string TransformStep::describe() const {
    std::ostringstream oss;
    switch (kind) {
        case StepKind::OmitRange:
            oss << "omit[" << first << ", " << second << ")";
            break;
        case StepKind::ExpandCategorical:
            oss << "one_hot(column=" << first << ", width=" << second << ")";
            break;
        case StepKind::AppendPosition:
            oss << "append_position";
            break;
        case StepKind::Normalize:
            oss << "normalize_xyz";
            break;
        case StepKind::KeepXyz:
            oss << "keep_xyz";
            break;
    }
    return oss.str();
}

void omitColumns(PointArray& points, std::size_t start, std::size_t end) {
    if (start >= end) {
        return;
    }
    const std::size_t removed = end - start;
    const std::size_t new_cols = points.cols - removed;
    std::vector<float> values(points.rows * new_cols);
    for (std::size_t r = 0; r < points.rows; ++r) {
        const float* src = points.row(r);
        float* dst = values.data() + r * new_cols;
        std::copy(src, src + start, dst);
        std::copy(src + end, src + points.cols, dst + start);
    }
    points.cols = new_cols;
    points.values = std::move(values);
}

void expandCategorical(PointArray& points, std::size_t column, std::size_t width) {
    const std::size_t new_cols = points.cols - 1 + width;
    std::vector<float> values(points.rows * new_cols, 0.0f);
    for (std::size_t r = 0; r < points.rows; ++r) {
        const float* src = points.row(r);
        float* dst = values.data() + r * new_cols;

        const float value = src[column];
        if (!std::isfinite(value) || value < 0.0f || value >= static_cast<float>(width)) {
            std::ostringstream oss;
            oss << "Categorical value " << value << " in column " << column
                << " is outside [0, " << width << ")";
            throw SampleError(oss.str());
        }
        const std::size_t category = static_cast<std::size_t>(value);

        std::copy(src, src + column, dst);
        dst[column + category] = 1.0f;
        std::copy(src + column + 1, src + points.cols, dst + column + width);
    }
    points.cols = new_cols;
    points.values = std::move(values);
}

void appendPositionalChannel(PointArray& points) {
    const std::size_t new_cols = points.cols + 1;
    std::vector<float> values(points.rows * new_cols);
    const double count = static_cast<double>(points.rows);
    for (std::size_t r = 0; r < points.rows; ++r) {
        const float* src = points.row(r);
        float* dst = values.data() + r * new_cols;
        std::copy(src, src + points.cols, dst);
        dst[points.cols] = static_cast<float>(static_cast<double>(r) / count);
    }
    points.cols = new_cols;
    points.values = std::move(values);
}

void normalizeToUnitSphere(PointArray& points) {
    if (points.rows == 0) {
        return;
    }

    double centroid[3] = {0.0, 0.0, 0.0};
    for (std::size_t r = 0; r < points.rows; ++r) {
        for (std::size_t c = 0; c < 3; ++c) {
            centroid[c] += points.at(r, c);
        }
    }
    for (double& value : centroid) {
        value /= static_cast<double>(points.rows);
    }

    double max_dist = 0.0;
    for (std::size_t r = 0; r < points.rows; ++r) {
        double sq = 0.0;
        for (std::size_t c = 0; c < 3; ++c) {
            const double d = points.at(r, c) - centroid[c];
            sq += d * d;
        }
        max_dist = std::max(max_dist, std::sqrt(sq));
    }

    // All points coincide: center only
    const double scale = max_dist > 0.0 ? 1.0 / max_dist : 1.0;
    for (std::size_t r = 0; r < points.rows; ++r) {
        for (std::size_t c = 0; c < 3; ++c) {
            points.at(r, c) = static_cast<float>((points.at(r, c) - centroid[c]) * scale);
        }
    }
}

void keepLeadingColumns(PointArray& points, std::size_t count) {
    if (count >= points.cols) {
        return;
    }
    std::vector<float> values(points.rows * count);
    for (std::size_t r = 0; r < points.rows; ++r) {
        const float* src = points.row(r);
        std::copy(src, src + count, values.data() + r * count);
    }
    points.cols = count;
    points.values = std::move(values);
}

FeatureTransformer::FeatureTransformer(const TransformOptions& options) {
    utils::ErrorAccumulator errors;
    errors.addAll(options.validate());
    errors.throwIfAny<ConfigError>("Invalid transform options: ");

    // Highest start first, so every range indexes the original layout
    const auto& ranges = options.omit_parameter_ranges;
    for (std::size_t i = 0; i + 1 < ranges.size(); i += 2) {
        decode_steps_.push_back({StepKind::OmitRange,
                                 static_cast<std::size_t>(ranges[i]),
                                 static_cast<std::size_t>(ranges[i + 1])});
    }
    std::stable_sort(decode_steps_.begin(), decode_steps_.end(),
                     [](const TransformStep& a, const TransformStep& b) {
                         return a.first > b.first;
                     });

    for (std::size_t i = 0; i < options.categorical_indexes.size(); ++i) {
        sample_steps_.push_back({StepKind::ExpandCategorical,
                                 static_cast<std::size_t>(options.categorical_indexes[i]),
                                 static_cast<std::size_t>(options.categorical_sizes[i])});
    }
    if (options.append_positional_channel) {
        sample_steps_.push_back({StepKind::AppendPosition});
    }
    if (options.normalize) {
        sample_steps_.push_back({StepKind::Normalize});
    }
    if (!options.include_normals) {
        sample_steps_.push_back({StepKind::KeepXyz});
    }
}

void FeatureTransformer::applyDecodeSteps(PointArray& points) const {
    for (const auto& step : decode_steps_) {
        step.apply(points);
    }
}

void FeatureTransformer::applySampleSteps(PointArray& points) const {
    for (const auto& step : sample_steps_) {
        step.apply(points);
    }
}

std::size_t FeatureTransformer::decodedWidth(std::size_t raw_width) const {
    std::size_t width = raw_width;
    for (const auto& step : decode_steps_) {
        width = step.outputWidth(width);
    }
    return width;
}

std::size_t FeatureTransformer::outputWidth(std::size_t decoded_width) const {
    std::size_t width = decoded_width;
    for (const auto& step : sample_steps_) {
        width = step.outputWidth(width);
    }
    return width;
}

}  // namespace pointcloud_dataset
