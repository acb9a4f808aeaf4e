// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#include "prefcol/http_remote_client.hpp"

#include <curl/curl.h>
#include <glog/logging.h>
#include <nlohmann/json.hpp>

#include <stdexcept>

namespace prefcol {

namespace {

using json = nlohmann::json;

/// Process-wide libcurl initialization, done once on first client construction
class CurlGlobal {
public:
    CurlGlobal() {
        const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    }

    ~CurlGlobal() {
        curl_global_cleanup();
    }
};

void ensure_curl_initialized() {
    static CurlGlobal global;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, total);
    return total;
}

int64_t now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace

HttpRemoteClient::HttpRemoteClient(const HttpRemoteClientConfig& config)
    : config_(config) {
    ensure_curl_initialized();

    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }

    LOG(INFO) << "HttpRemoteClient initialized, endpoint: " << config_.base_url
              << (config_.api_key.empty() ? " (no API key)" : "");
}

HttpRemoteClient::~HttpRemoteClient() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    VLOG(1) << "HttpRemoteClient destroyed. Stats: sent=" << stats_.records_sent
            << " failed=" << stats_.records_failed
            << " bytes=" << stats_.bytes_sent;
}

std::string HttpRemoteClient::build_request_body(const PreferencePayload& payload) {
    json scores = json::object();
    if (payload.dimension_scores.empty()) {
        scores["accuracy"] = 3;
        scores["safety"] = 3;
        scores["actionability"] = 3;
        scores["clarity"] = 3;
    } else {
        for (const auto& [dimension, score] : payload.dimension_scores) {
            scores[dimension] = score;
        }
    }

    json body = {
        {"domain", payload.domain},
        {"category", payload.category},
        {"prompt", payload.prompt},
        {"response_a", payload.response_a},
        {"response_b", payload.response_b},
        {"preference", payload.preference},
        {"annotator_id", payload.annotator_id},
        {"dimension_scores", scores},
        {"response_a_model", payload.response_a_model},
        {"response_b_model", payload.response_b_model},
        {"notes", payload.notes},
    };

    // Invalid UTF-8 from producers is replaced rather than aborting the send
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool HttpRemoteClient::parse_response(const std::string& body,
                                      std::optional<std::string>* hash) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return false;
    }

    auto it = parsed.find("hash");
    if (hash && it != parsed.end() && it->is_string()) {
        *hash = it->get<std::string>();
    }
    return true;
}

SendResult HttpRemoteClient::send(const PreferencePayload& payload) {
    const std::string body = build_request_body(payload);
    Response response = perform("POST", "/api/preferences", body);

    if (!response.error.empty()) {
        record_failure();
        return SendResult::failure(response.error);
    }

    if (response.status < 200 || response.status >= 300) {
        record_failure();
        return SendResult::failure("POST /api/preferences returned HTTP " +
                                   std::to_string(response.status));
    }

    std::optional<std::string> hash;
    if (!parse_response(response.body, &hash)) {
        record_failure();
        return SendResult::failure("Invalid response body from /api/preferences");
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.records_sent++;
        stats_.bytes_sent += body.size();
        stats_.last_send_timestamp_ns = now_ns();
    }

    VLOG(2) << "Stored preference for domain " << payload.domain
            << (hash ? " hash=" + *hash : std::string());

    SendResult result;
    result.success = true;
    result.hash = std::move(hash);
    return result;
}

bool HttpRemoteClient::healthy() {
    Response response = perform("GET", "/api/health", "");
    if (!response.error.empty()) {
        LOG(WARNING) << "Health check failed: " << response.error;
        return false;
    }
    if (response.status < 200 || response.status >= 300) {
        LOG(WARNING) << "Health check returned HTTP " << response.status;
        return false;
    }
    return true;
}

ClientStats HttpRemoteClient::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

HttpRemoteClient::Response HttpRemoteClient::perform(const std::string& method,
                                                     const std::string& path,
                                                     const std::string& body) {
    Response response;
    const std::string url = config_.base_url + path;

    CURL* handle = curl_easy_init();
    if (!handle) {
        response.error = "curl_easy_init failed";
        return response;
    }

    const long timeout_ms = static_cast<long>(config_.timeout.count());

    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        curl_easy_setopt(handle, CURLOPT_POST, 1L);
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    }

    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "Content-Type: application/json");
    if (!config_.api_key.empty()) {
        const std::string key_header = "X-API-Key: " + config_.api_key;
        header_list = curl_slist_append(header_list, key_header.c_str());
    }
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list);

    const CURLcode code = curl_easy_perform(handle);
    if (code == CURLE_OK) {
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
    } else {
        response.error = method + " " + url + " failed: " + curl_easy_strerror(code);
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(handle);
    return response;
}

void HttpRemoteClient::record_failure() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.records_failed++;
}

}  // namespace prefcol
