// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file jsonl_reader.hpp
/// @brief Decode comparisons from JSON Lines input
///
/// One object per line:
/// @code
///   {"prompt": "...", "response_a": "...", "response_b": "...",
///    "chosen": "A", "producer_id": "user123", "category": "far_dfars",
///    "session_id": "s1", "latency_a": 1.2, "latency_b": 0.9,
///    "confidence": 0.8, "context": {"page": "compare"},
///    "response_a_model": "m1", "response_b_model": "m2",
///    "dimension_scores": {"accuracy": 4}}
/// @endcode
/// Required: prompt, response_a, response_b, chosen.

#include "comparison.hpp"

#include <functional>
#include <istream>
#include <optional>
#include <string>

namespace prefcol::pipeline {

/// Decode one JSON object into a submission
/// @param line JSON text
/// @param error Receives a description when decoding fails (may be null)
/// @return submission, or nullopt if the line is not a valid comparison
std::optional<ComparisonSubmission> parse_comparison_json(const std::string& line,
                                                          std::string* error = nullptr);

/// Counters from a read_comparisons() pass
struct JsonlReadStats {
    size_t lines = 0;      ///< Non-blank lines seen
    size_t decoded = 0;    ///< Lines handed to the callback
    size_t malformed = 0;  ///< Lines skipped as undecodable
};

/// Read JSON Lines from a stream, invoking on_comparison for each decodable
/// line. Blank lines are skipped; malformed lines are logged and counted.
/// Reading stops early when should_continue returns false.
JsonlReadStats read_comparisons(std::istream& input,
                                const std::function<void(const ComparisonSubmission&)>& on_comparison,
                                const std::function<bool()>& should_continue = {});

}  // namespace prefcol::pipeline
