// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file quality_gate.hpp
/// @brief Structural validation of preference pairs before they are queued
///
/// The gate runs an ordered list of checks; the first failing check decides
/// the rejection reason. Formatting and latency metrics are computed for
/// every submission and never influence the verdict.

#include "comparison.hpp"

#include <cstddef>
#include <string>

namespace prefcol::pipeline {

/// Rejection thresholds
struct QualityThresholds {
    size_t min_prompt_length = 10;
    size_t min_response_length = 50;
    size_t max_response_length = 10000;
    double min_length_ratio = 0.3;     ///< shorter / longer response
    double echo_length_factor = 1.5;   ///< response shorter than this x prompt may be an echo
};

/// Metrics computed for one submission
struct QualityMetrics {
    size_t prompt_length = 0;
    size_t response_a_length = 0;
    size_t response_b_length = 0;
    double length_ratio = 0.0;
    bool has_code = false;
    bool has_formatting = false;
    double latency_diff = 0.0;
    bool is_valid = false;
    std::string rejection_reason;
};

/// Stateless validator for ComparisonSubmission
///
/// Example:
/// @code
///   QualityGate gate;
///   auto metrics = gate.validate(submission);
///   if (!metrics.is_valid) LOG(INFO) << metrics.rejection_reason;
/// @endcode
class QualityGate {
public:
    explicit QualityGate(const QualityThresholds& thresholds = {});

    /// Validate a submission. Never throws.
    QualityMetrics validate(const ComparisonSubmission& submission) const;

    const QualityThresholds& thresholds() const { return thresholds_; }

private:
    QualityThresholds thresholds_;
};

}  // namespace prefcol::pipeline
