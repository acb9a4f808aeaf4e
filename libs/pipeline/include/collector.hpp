// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file collector.hpp
/// @brief Preference ingestion pipeline exposed to producers
///
/// Collector orchestrates:
/// - Quality validation (QualityGate)
/// - Duplicate suppression (DeduplicationCache)
/// - Buffering (SubmissionQueue)
/// - Transmission (RemoteClient), on batch threshold or timer (BackgroundFlusher)
///
/// Data flow:
///   submit() -> QualityGate -> DeduplicationCache -> SubmissionQueue
///            -> flush() -> RemoteClient::send() per record
///
/// submit() reports only acceptance. Whether an accepted record reached the
/// store is visible through stats() (submitted vs failed) and the log.

#include "background_flusher.hpp"
#include "comparison.hpp"
#include "dedup_cache.hpp"
#include "quality_gate.hpp"
#include "submission_queue.hpp"
#include "prefcol/remote_client.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace prefcol::pipeline {

/// Configuration for the collector
struct CollectorConfig {
    // Queue depth that triggers an immediate flush from submit()
    size_t batch_size = 10;

    // Interval between background flushes
    std::chrono::milliseconds flush_interval{60000};

    // Bypass QualityGate entirely when false
    bool quality_gate_enabled = true;

    // Run the background flusher when true
    bool auto_flush = true;

    size_t dedup_max_size = DeduplicationCache::kDefaultMaxSize;

    // Queue capacity, 0 = unbounded. A full queue is flushed synchronously.
    size_t max_queue_depth = 0;

    QualityThresholds thresholds;
};

/// Snapshot of collector statistics
struct CollectorStats {
    uint64_t collected = 0;
    uint64_t submitted = 0;
    uint64_t rejected_quality = 0;
    uint64_t rejected_duplicate = 0;
    uint64_t failed = 0;
    uint64_t queue_depth = 0;

    /// Fraction of collected records that reached the store
    double acceptance_rate() const {
        return collected > 0
            ? static_cast<double>(submitted) / collected
            : 0.0;
    }
};

/// Preference collector
///
/// Thread-safe for concurrent submit() from many producers.
///
/// Example:
/// @code
///   auto client = std::make_shared<HttpRemoteClient>(http_config);
///   Collector collector("procurement", client);
///   collector.submit(prompt, answer_a, answer_b, ChosenSide::A, "user123");
///   ...
///   collector.stop();  // drains the queue
/// @endcode
class Collector {
public:
    /// Create a collector; starts the background flusher if config.auto_flush
    /// @throws std::invalid_argument if client is null, or auto_flush is set
    ///         with a non-positive flush_interval
    /// @param domain Domain assigned to every submission
    /// @param client Remote store client
    /// @param config Collector configuration
    Collector(std::string domain,
              std::shared_ptr<RemoteClient> client,
              const CollectorConfig& config = {});

    ~Collector();

    Collector(const Collector&) = delete;
    Collector& operator=(const Collector&) = delete;

    /// Submit a comparison. The collector's domain replaces submission.domain.
    /// @return true if accepted (queued or already flushed),
    ///         false if rejected by the quality gate or as a duplicate
    bool submit(const ComparisonSubmission& submission);

    /// Convenience overload building the submission from its fields
    bool submit(const std::string& prompt,
                const std::string& response_a,
                const std::string& response_b,
                ChosenSide chosen,
                const std::string& producer_id,
                const std::string& category = "general",
                const std::string& session_id = "",
                double latency_a = 0.0,
                double latency_b = 0.0,
                double confidence = 1.0,
                const std::map<std::string, std::string>& context = {});

    /// Send every queued record, one attempt each
    /// @return number of records successfully sent
    size_t flush();

    /// Stop the background flusher and drain the queue.
    /// Repeated calls (and the destructor) drain anything submitted since.
    void stop();

    /// Get statistics
    CollectorStats stats() const;

    /// Reason for the most recent rejection (empty if none yet)
    std::string last_rejection_reason() const;

    const std::string& domain() const { return domain_; }
    const CollectorConfig& config() const { return config_; }

private:
    void enqueue(QueuedRecord record);
    void reject(std::atomic<uint64_t>& counter, std::string reason);
    bool send_one(const QueuedRecord& record);

    std::string domain_;
    CollectorConfig config_;

    // Components
    std::shared_ptr<RemoteClient> client_;
    QualityGate quality_gate_;
    DeduplicationCache dedup_cache_;
    SubmissionQueue queue_;
    std::unique_ptr<BackgroundFlusher> flusher_;

    // Only one drain at a time keeps FIFO order and counts exact
    std::mutex flush_mutex_;

    std::atomic<bool> stopped_{false};

    // Stats
    std::atomic<uint64_t> collected_{0};
    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> rejected_quality_{0};
    std::atomic<uint64_t> rejected_duplicate_{0};
    std::atomic<uint64_t> failed_{0};

    mutable std::mutex reason_mutex_;
    std::string last_rejection_reason_;
};

}  // namespace prefcol::pipeline
