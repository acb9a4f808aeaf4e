// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file http_remote_client.hpp
/// @brief HTTP/JSON implementation of the remote preference store client
///
/// HttpRemoteClient maps RemoteClient onto the store's REST API:
/// - send(payload) -> POST {base_url}/api/preferences
/// - healthy()     -> GET  {base_url}/api/health

#include "prefcol/remote_client.hpp"

#include <chrono>
#include <mutex>
#include <string>

namespace prefcol {

/// Configuration for the HTTP client
struct HttpRemoteClientConfig {
    std::string base_url = "https://zuup1-zuup-preference-collection.hf.space";
    std::string api_key;  ///< Sent as X-API-Key when non-empty
    std::chrono::milliseconds timeout{10000};
};

/// HTTP client for the remote preference store
class HttpRemoteClient : public RemoteClient {
public:
    explicit HttpRemoteClient(const HttpRemoteClientConfig& config = {});
    ~HttpRemoteClient() override;

    HttpRemoteClient(const HttpRemoteClient&) = delete;
    HttpRemoteClient& operator=(const HttpRemoteClient&) = delete;

    SendResult send(const PreferencePayload& payload) override;
    bool healthy() override;
    ClientStats stats() const override;
    std::string name() const override { return "http"; }

    /// Serialize a payload into the JSON request body.
    /// Empty dimension_scores are replaced by the neutral defaults.
    static std::string build_request_body(const PreferencePayload& payload);

    /// Parse a store response body
    /// @param body Response body
    /// @param hash Receives the record hash when the body carries one
    /// @return false if the body is not a JSON object
    static bool parse_response(const std::string& body, std::optional<std::string>* hash);

    const std::string& base_url() const { return config_.base_url; }

private:
    struct Response {
        long status = 0;
        std::string body;
        std::string error;  ///< Transport error, empty when a response arrived
    };

    Response perform(const std::string& method, const std::string& path,
                     const std::string& body);

    void record_failure();

    HttpRemoteClientConfig config_;

    mutable std::mutex stats_mutex_;
    ClientStats stats_;
};

}  // namespace prefcol
