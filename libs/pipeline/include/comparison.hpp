// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file comparison.hpp
/// @brief Preference comparison records flowing through the pipeline
///
/// ComparisonSubmission is what a producer hands to the Collector.
/// QueuedRecord is an accepted submission with a server timestamp and
/// normalized domain/category, ready for transmission.

#include "prefcol/remote_client.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace prefcol::pipeline {

/// Which response the producer preferred
enum class ChosenSide {
    A,
    B,
    TIE
};

/// Convert ChosenSide to string
/// @return "A", "B" or "TIE"
const char* to_string(ChosenSide side);

/// Parse ChosenSide from string
/// @param name Side name (case-insensitive: "a", "B", "tie")
/// @return ChosenSide if valid, nullopt if unknown
std::optional<ChosenSide> chosen_side_from_string(const std::string& name);

/// A pairwise preference judgment as submitted by a producer
struct ComparisonSubmission {
    std::string prompt;
    std::string response_a;
    std::string response_b;
    ChosenSide chosen = ChosenSide::A;

    std::string domain;
    std::string category = "general";
    std::string producer_id;
    std::string session_id;

    // Generation metadata
    std::string response_a_model;
    std::string response_b_model;
    double latency_a = 0.0;  ///< Seconds to generate response A
    double latency_b = 0.0;  ///< Seconds to generate response B

    double confidence = 1.0;  ///< Producer confidence in the choice, 0-1
    std::map<std::string, std::string> context;
    std::map<std::string, int> dimension_scores;
};

/// An accepted submission waiting in the SubmissionQueue
struct QueuedRecord {
    ComparisonSubmission submission;  ///< domain/category already normalized
    std::chrono::system_clock::time_point accepted_at;

    /// Build a record from an accepted submission, normalizing domain/category
    static QueuedRecord from_submission(const ComparisonSubmission& submission,
                                        std::chrono::system_clock::time_point now =
                                            std::chrono::system_clock::now());

    /// Convert to the remote store payload
    PreferencePayload to_payload() const;
};

/// Normalize a domain or category identifier
/// Trims, lower-cases, and maps whitespace and '-' to '_'.
std::string normalize_identifier(const std::string& value);

/// Render a timestamp as ISO-8601 UTC with millisecond precision
std::string format_timestamp(std::chrono::system_clock::time_point tp);

}  // namespace prefcol::pipeline
