// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#include "collector_settings.hpp"
#include "text_utils.hpp"

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>

namespace prefcol::pipeline {

namespace {

size_t as_count(const YAML::Node& node, const char* name) {
    const long long value = node.as<long long>();
    if (value < 0) {
        throw ConfigError(std::string(name) + " must not be negative");
    }
    return static_cast<size_t>(value);
}

std::chrono::milliseconds seconds_to_ms(double seconds, const std::string& name) {
    if (seconds < 0.0) {
        throw ConfigError(name + " must not be negative");
    }
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

double parse_double(const std::string& name, const std::string& value) {
    char* end = nullptr;
    const double parsed = std::strtod(value.c_str(), &end);
    if (value.empty() || end == value.c_str() || *end != '\0') {
        throw ConfigError("Invalid number for " + name + ": '" + value + "'");
    }
    return parsed;
}

size_t parse_count(const std::string& name, const std::string& value) {
    char* end = nullptr;
    const long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (value.empty() || end == value.c_str() || *end != '\0' || parsed < 0) {
        throw ConfigError("Invalid count for " + name + ": '" + value + "'");
    }
    return static_cast<size_t>(parsed);
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && value[0] != '\0') ? value : nullptr;
}

}  // namespace

bool parse_bool(const std::string& name, const std::string& value) {
    const std::string lower = to_lower(trim(value));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
        return false;
    }
    throw ConfigError("Invalid boolean for " + name + ": '" + value + "'");
}

void load_settings_file(const std::string& path, CollectorSettings& settings) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);

        if (yaml["collector"]) {
            auto c = yaml["collector"];
            if (c["domain"]) settings.domain = c["domain"].as<std::string>();
            if (c["batch_size"]) settings.collector.batch_size = as_count(c["batch_size"], "batch_size");
            if (c["flush_interval_sec"]) {
                settings.collector.flush_interval =
                    seconds_to_ms(c["flush_interval_sec"].as<double>(), "flush_interval_sec");
            }
            if (c["quality_gate_enabled"]) settings.collector.quality_gate_enabled = c["quality_gate_enabled"].as<bool>();
            if (c["auto_flush"]) settings.collector.auto_flush = c["auto_flush"].as<bool>();
            if (c["dedup_max_size"]) settings.collector.dedup_max_size = as_count(c["dedup_max_size"], "dedup_max_size");
            if (c["max_queue_depth"]) settings.collector.max_queue_depth = as_count(c["max_queue_depth"], "max_queue_depth");
        }

        if (yaml["quality"]) {
            auto q = yaml["quality"];
            auto& t = settings.collector.thresholds;
            if (q["min_prompt_length"]) t.min_prompt_length = as_count(q["min_prompt_length"], "min_prompt_length");
            if (q["min_response_length"]) t.min_response_length = as_count(q["min_response_length"], "min_response_length");
            if (q["max_response_length"]) t.max_response_length = as_count(q["max_response_length"], "max_response_length");
            if (q["min_length_ratio"]) t.min_length_ratio = q["min_length_ratio"].as<double>();
            if (q["echo_length_factor"]) t.echo_length_factor = q["echo_length_factor"].as<double>();
        }

        if (yaml["remote"]) {
            auto r = yaml["remote"];
            if (r["base_url"]) settings.remote.base_url = r["base_url"].as<std::string>();
            if (r["api_key"]) settings.remote.api_key = r["api_key"].as<std::string>();
            if (r["timeout_sec"]) settings.remote.timeout = seconds_to_ms(r["timeout_sec"].as<double>(), "timeout_sec");
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load config " + path + ": " + e.what());
    }

    LOG(INFO) << "Loaded configuration from " << path;
}

void apply_environment(CollectorSettings& settings) {
    if (const char* v = env("PREFCOL_DOMAIN")) {
        settings.domain = v;
    }
    if (const char* v = env("PREFCOL_BATCH_SIZE")) {
        settings.collector.batch_size = parse_count("PREFCOL_BATCH_SIZE", v);
    }
    if (const char* v = env("PREFCOL_FLUSH_INTERVAL")) {
        settings.collector.flush_interval =
            seconds_to_ms(parse_double("PREFCOL_FLUSH_INTERVAL", v), "PREFCOL_FLUSH_INTERVAL");
    }
    if (const char* v = env("PREFCOL_QUALITY_GATE")) {
        settings.collector.quality_gate_enabled = parse_bool("PREFCOL_QUALITY_GATE", v);
    }
    if (const char* v = env("PREFCOL_AUTO_FLUSH")) {
        settings.collector.auto_flush = parse_bool("PREFCOL_AUTO_FLUSH", v);
    }
    if (const char* v = env("PREFCOL_API_URL")) {
        settings.remote.base_url = v;
    }
    if (const char* v = env("PREFCOL_API_KEY")) {
        settings.remote.api_key = v;
    }
}

void validate_settings(const CollectorSettings& settings) {
    const auto& c = settings.collector;
    const auto& t = c.thresholds;

    if (trim(settings.domain).empty()) {
        throw ConfigError("domain must not be empty");
    }
    if (c.batch_size == 0) {
        throw ConfigError("batch_size must be at least 1");
    }
    if (c.auto_flush && c.flush_interval.count() <= 0) {
        throw ConfigError("flush_interval must be positive when auto_flush is enabled");
    }
    if (c.dedup_max_size == 0) {
        throw ConfigError("dedup_max_size must be at least 1");
    }
    if (t.min_response_length > t.max_response_length) {
        throw ConfigError("min_response_length exceeds max_response_length");
    }
    if (t.min_length_ratio < 0.0 || t.min_length_ratio > 1.0) {
        throw ConfigError("min_length_ratio must be within [0, 1]");
    }
    if (settings.remote.base_url.empty()) {
        throw ConfigError("remote base_url must not be empty");
    }
}

}  // namespace prefcol::pipeline
