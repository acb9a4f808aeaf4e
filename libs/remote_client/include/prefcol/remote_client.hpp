// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file remote_client.hpp
/// @brief Abstract interface for the remote preference store
///
/// RemoteClient decouples record transmission from the ingestion pipeline.
/// The pipeline hands over one fully-formed payload at a time and learns
/// only whether the store accepted it.
///
/// Implementations:
/// - HttpRemoteClient: POST {base_url}/api/preferences with an API key header

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace prefcol {

// =============================================================================
// Payload and Result Types
// =============================================================================

/// One preference record as the remote store expects it
struct PreferencePayload {
    std::string domain;
    std::string category = "general";
    std::string prompt;
    std::string response_a;
    std::string response_b;
    std::string preference;  ///< "A", "B" or "TIE"
    std::string annotator_id;
    std::map<std::string, int> dimension_scores;  ///< Empty = store defaults
    std::string response_a_model;
    std::string response_b_model;
    std::string notes;  ///< Free-text, the pipeline puts a JSON object here
};

/// Outcome of a single send attempt
struct SendResult {
    bool success = false;
    std::optional<std::string> hash;   ///< Content hash assigned by the store
    std::optional<std::string> error;  ///< Set when success is false

    static SendResult ok(std::string record_hash) {
        SendResult r;
        r.success = true;
        r.hash = std::move(record_hash);
        return r;
    }

    static SendResult failure(std::string message) {
        SendResult r;
        r.error = std::move(message);
        return r;
    }
};

/// Client-side transport statistics
struct ClientStats {
    uint64_t records_sent = 0;
    uint64_t records_failed = 0;
    uint64_t bytes_sent = 0;
    int64_t last_send_timestamp_ns = 0;
};

// =============================================================================
// RemoteClient Interface
// =============================================================================

/// Abstract interface for the remote preference store.
///
/// A send is a single synchronous attempt and may block on network I/O.
/// Implementations report every failure through SendResult; callers still
/// guard against exceptions at their own boundary.
class RemoteClient {
public:
    virtual ~RemoteClient() = default;

    /// Submit one record
    /// @param payload Record to store
    /// @return success flag plus store hash, or an error message
    virtual SendResult send(const PreferencePayload& payload) = 0;

    /// Check if the store is reachable and healthy
    virtual bool healthy() { return true; }

    /// Get statistics
    virtual ClientStats stats() const = 0;

    /// Get client name for logging
    virtual std::string name() const = 0;
};

}  // namespace prefcol
