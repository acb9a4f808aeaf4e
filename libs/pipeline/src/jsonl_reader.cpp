// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#include "jsonl_reader.hpp"
#include "text_utils.hpp"

#include <glog/logging.h>
#include <nlohmann/json.hpp>

namespace prefcol::pipeline {

namespace {

using json = nlohmann::json;

void set_error(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

}  // namespace

std::optional<ComparisonSubmission> parse_comparison_json(const std::string& line,
                                                          std::string* error) {
    json obj = json::parse(line, nullptr, false);
    if (obj.is_discarded() || !obj.is_object()) {
        set_error(error, "not a JSON object");
        return std::nullopt;
    }

    for (const char* field : {"prompt", "response_a", "response_b", "chosen"}) {
        auto it = obj.find(field);
        if (it == obj.end() || !it->is_string()) {
            set_error(error, std::string("missing string field '") + field + "'");
            return std::nullopt;
        }
    }

    auto chosen = chosen_side_from_string(obj["chosen"].get<std::string>());
    if (!chosen) {
        set_error(error, "invalid chosen side '" + obj["chosen"].get<std::string>() + "'");
        return std::nullopt;
    }

    try {
        ComparisonSubmission s;
        s.prompt = obj["prompt"].get<std::string>();
        s.response_a = obj["response_a"].get<std::string>();
        s.response_b = obj["response_b"].get<std::string>();
        s.chosen = *chosen;
        s.producer_id = obj.value("producer_id", std::string());
        s.category = obj.value("category", std::string("general"));
        s.session_id = obj.value("session_id", std::string());
        s.response_a_model = obj.value("response_a_model", std::string());
        s.response_b_model = obj.value("response_b_model", std::string());
        s.latency_a = obj.value("latency_a", 0.0);
        s.latency_b = obj.value("latency_b", 0.0);
        s.confidence = obj.value("confidence", 1.0);

        if (obj.contains("context") && obj["context"].is_object()) {
            for (const auto& [key, value] : obj["context"].items()) {
                s.context[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
        if (obj.contains("dimension_scores") && obj["dimension_scores"].is_object()) {
            for (const auto& [key, value] : obj["dimension_scores"].items()) {
                s.dimension_scores[key] = value.get<int>();
            }
        }
        return s;
    } catch (const json::exception& e) {
        set_error(error, e.what());
        return std::nullopt;
    }
}

JsonlReadStats read_comparisons(std::istream& input,
                                const std::function<void(const ComparisonSubmission&)>& on_comparison,
                                const std::function<bool()>& should_continue) {
    JsonlReadStats stats;
    std::string line;
    size_t line_number = 0;

    while ((!should_continue || should_continue()) && std::getline(input, line)) {
        ++line_number;
        if (trim(line).empty()) {
            continue;
        }
        ++stats.lines;

        std::string error;
        auto submission = parse_comparison_json(line, &error);
        if (!submission) {
            ++stats.malformed;
            LOG(WARNING) << "Skipping line " << line_number << ": " << error;
            continue;
        }

        ++stats.decoded;
        on_comparison(*submission);
    }
    return stats;
}

}  // namespace prefcol::pipeline
