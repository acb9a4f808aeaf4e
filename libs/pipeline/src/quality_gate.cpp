// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#include "quality_gate.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace prefcol::pipeline {

namespace {

const char* const kCodeFence = "```";
const char* const kFormattingMarkers[] = {"**", "##", "- ", "1. "};

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string too_short(const char* what, size_t length) {
    return std::string(what) + " too short (" + std::to_string(length) + " chars)";
}

std::string too_long(const char* what, size_t length) {
    return std::string(what) + " too long (" + std::to_string(length) + " chars)";
}

std::string with_two_decimals(const char* prefix, double value) {
    std::ostringstream oss;
    oss << prefix << " (" << std::fixed << std::setprecision(2) << value << ")";
    return oss.str();
}

}  // namespace

QualityGate::QualityGate(const QualityThresholds& thresholds)
    : thresholds_(thresholds) {
}

QualityMetrics QualityGate::validate(const ComparisonSubmission& s) const {
    QualityMetrics m;
    m.prompt_length = char_length(s.prompt);
    m.response_a_length = char_length(s.response_a);
    m.response_b_length = char_length(s.response_b);

    const size_t longer = std::max(m.response_a_length, m.response_b_length);
    const size_t shorter = std::min(m.response_a_length, m.response_b_length);
    m.length_ratio = longer > 0 ? static_cast<double>(shorter) / longer : 0.0;

    m.has_code = contains(s.response_a, kCodeFence) || contains(s.response_b, kCodeFence);
    for (const char* marker : kFormattingMarkers) {
        if (contains(s.response_a, marker) || contains(s.response_b, marker)) {
            m.has_formatting = true;
            break;
        }
    }
    m.latency_diff = std::fabs(s.latency_a - s.latency_b);

    const auto& t = thresholds_;
    const std::string trimmed_prompt = trim(s.prompt);
    const double echo_limit = static_cast<double>(m.prompt_length) * t.echo_length_factor;

    auto echoes_prompt = [&](const std::string& response, size_t length) {
        return contains(response, trimmed_prompt) &&
               static_cast<double>(length) < echo_limit;
    };

    std::string reason;
    if (m.prompt_length < t.min_prompt_length) {
        reason = too_short("Prompt", m.prompt_length);
    } else if (m.response_a_length < t.min_response_length) {
        reason = too_short("Response A", m.response_a_length);
    } else if (m.response_b_length < t.min_response_length) {
        reason = too_short("Response B", m.response_b_length);
    } else if (m.response_a_length > t.max_response_length) {
        reason = too_long("Response A", m.response_a_length);
    } else if (m.response_b_length > t.max_response_length) {
        reason = too_long("Response B", m.response_b_length);
    } else if (m.length_ratio < t.min_length_ratio) {
        reason = with_two_decimals("Response length ratio too skewed", m.length_ratio);
    } else if (trim(s.response_a) == trim(s.response_b)) {
        reason = "Responses are identical";
    } else if (echoes_prompt(s.response_a, m.response_a_length) ||
               echoes_prompt(s.response_b, m.response_b_length)) {
        reason = "Response too similar to prompt";
    } else if (trim(s.producer_id).empty()) {
        reason = "Missing producer identifier";
    } else if (std::isnan(s.confidence) || s.confidence < 0.0 || s.confidence > 1.0) {
        reason = with_two_decimals("Confidence out of range", s.confidence);
    }

    m.is_valid = reason.empty();
    m.rejection_reason = std::move(reason);
    return m;
}

}  // namespace prefcol::pipeline
