// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file collector_settings.hpp
/// @brief Layered configuration: defaults, YAML file, environment
///
/// YAML layout:
/// @code
///   collector:
///     domain: procurement
///     batch_size: 10
///     flush_interval_sec: 60
///     quality_gate_enabled: true
///     auto_flush: true
///     dedup_max_size: 10000
///     max_queue_depth: 0
///   quality:
///     min_prompt_length: 10
///     min_response_length: 50
///     max_response_length: 10000
///     min_length_ratio: 0.3
///   remote:
///     base_url: https://store.example.com
///     api_key: secret
///     timeout_sec: 10
/// @endcode
///
/// Environment overrides: PREFCOL_DOMAIN, PREFCOL_BATCH_SIZE,
/// PREFCOL_FLUSH_INTERVAL, PREFCOL_QUALITY_GATE, PREFCOL_AUTO_FLUSH,
/// PREFCOL_API_URL, PREFCOL_API_KEY.

#include "collector.hpp"
#include "prefcol/http_remote_client.hpp"

#include <stdexcept>
#include <string>

namespace prefcol::pipeline {

/// Raised for unreadable files and invalid values
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Everything needed to build a Collector and its HTTP client
struct CollectorSettings {
    std::string domain = "general";
    CollectorConfig collector;
    HttpRemoteClientConfig remote;
};

/// Overlay values from a YAML file onto settings
/// @throws ConfigError if the file cannot be parsed or holds invalid values
void load_settings_file(const std::string& path, CollectorSettings& settings);

/// Overlay values from PREFCOL_* environment variables onto settings
/// @throws ConfigError on unparsable values
void apply_environment(CollectorSettings& settings);

/// Check cross-field constraints
/// @throws ConfigError describing the first violation
void validate_settings(const CollectorSettings& settings);

/// Parse a boolean flag value ("true"/"false"/"1"/"0"/"yes"/"no"/"on"/"off")
/// @throws ConfigError for anything else
bool parse_bool(const std::string& name, const std::string& value);

}  // namespace prefcol::pipeline
