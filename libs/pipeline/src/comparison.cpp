// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#include "comparison.hpp"
#include "text_utils.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace prefcol::pipeline {

const char* to_string(ChosenSide side) {
    switch (side) {
        case ChosenSide::A: return "A";
        case ChosenSide::B: return "B";
        case ChosenSide::TIE: return "TIE";
    }
    return "A";
}

std::optional<ChosenSide> chosen_side_from_string(const std::string& name) {
    const std::string lower = to_lower(trim(name));
    if (lower == "a") {
        return ChosenSide::A;
    }
    if (lower == "b") {
        return ChosenSide::B;
    }
    if (lower == "tie") {
        return ChosenSide::TIE;
    }
    return std::nullopt;
}

std::string normalize_identifier(const std::string& value) {
    std::string result;
    bool pending_separator = false;

    for (unsigned char c : to_lower(trim(value))) {
        if (std::isspace(c) || c == '-' || c == '_') {
            pending_separator = true;
            continue;
        }
        if (pending_separator && !result.empty()) {
            result += '_';
        }
        pending_separator = false;
        result += static_cast<char>(c);
    }
    return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

QueuedRecord QueuedRecord::from_submission(const ComparisonSubmission& submission,
                                           std::chrono::system_clock::time_point now) {
    QueuedRecord record;
    record.submission = submission;
    record.submission.domain = normalize_identifier(submission.domain);
    record.submission.category = normalize_identifier(submission.category);
    if (record.submission.category.empty()) {
        record.submission.category = "general";
    }
    record.accepted_at = now;
    return record;
}

PreferencePayload QueuedRecord::to_payload() const {
    const auto& s = submission;

    PreferencePayload payload;
    payload.domain = s.domain;
    payload.category = s.category;
    payload.prompt = s.prompt;
    payload.response_a = s.response_a;
    payload.response_b = s.response_b;
    payload.preference = to_string(s.chosen);
    payload.annotator_id = "platform_" + s.producer_id;
    payload.dimension_scores = s.dimension_scores;
    payload.response_a_model = s.response_a_model;
    payload.response_b_model = s.response_b_model;

    nlohmann::json notes = {
        {"session", s.session_id},
        {"confidence", s.confidence},
        {"response_time_a", s.latency_a},
        {"response_time_b", s.latency_b},
        {"timestamp", format_timestamp(accepted_at)},
    };
    if (!s.context.empty()) {
        notes["context"] = s.context;
    }
    payload.notes = notes.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    return payload;
}

}  // namespace prefcol::pipeline
