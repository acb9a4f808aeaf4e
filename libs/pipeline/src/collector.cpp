// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#include "collector.hpp"

#include <glog/logging.h>

#include <iomanip>
#include <stdexcept>

namespace prefcol::pipeline {

Collector::Collector(std::string domain,
                     std::shared_ptr<RemoteClient> client,
                     const CollectorConfig& config)
    : domain_(std::move(domain))
    , config_(config)
    , client_(std::move(client))
    , quality_gate_(config.thresholds)
    , dedup_cache_(config.dedup_max_size)
    , queue_(config.max_queue_depth) {
    if (!client_) {
        throw std::invalid_argument("Collector requires a RemoteClient");
    }
    if (config_.batch_size == 0) {
        config_.batch_size = 1;
    }
    if (config_.auto_flush && config_.flush_interval.count() <= 0) {
        throw std::invalid_argument("Collector flush_interval must be positive when auto_flush is enabled");
    }

    if (config_.auto_flush) {
        flusher_ = std::make_unique<BackgroundFlusher>(
            config_.flush_interval, [this] { flush(); });
        flusher_->start();
    }

    LOG(INFO) << "Collector started for domain '" << domain_ << "' with "
              << client_->name() << " client, batch_size=" << config_.batch_size
              << " flush_interval=" << config_.flush_interval.count() << "ms"
              << (config_.quality_gate_enabled ? "" : " (quality gate disabled)")
              << (config_.auto_flush ? "" : " (auto flush disabled)");
}

Collector::~Collector() {
    stop();
}

bool Collector::submit(const std::string& prompt,
                       const std::string& response_a,
                       const std::string& response_b,
                       ChosenSide chosen,
                       const std::string& producer_id,
                       const std::string& category,
                       const std::string& session_id,
                       double latency_a,
                       double latency_b,
                       double confidence,
                       const std::map<std::string, std::string>& context) {
    ComparisonSubmission submission;
    submission.prompt = prompt;
    submission.response_a = response_a;
    submission.response_b = response_b;
    submission.chosen = chosen;
    submission.producer_id = producer_id;
    submission.category = category;
    submission.session_id = session_id;
    submission.latency_a = latency_a;
    submission.latency_b = latency_b;
    submission.confidence = confidence;
    submission.context = context;
    return submit(submission);
}

bool Collector::submit(const ComparisonSubmission& submission) {
    collected_++;

    if (config_.quality_gate_enabled) {
        QualityMetrics metrics = quality_gate_.validate(submission);
        if (!metrics.is_valid) {
            reject(rejected_quality_, std::move(metrics.rejection_reason));
            return false;
        }
    }

    if (dedup_cache_.is_duplicate(submission)) {
        reject(rejected_duplicate_, "Duplicate comparison");
        return false;
    }

    ComparisonSubmission stamped = submission;
    stamped.domain = domain_;
    enqueue(QueuedRecord::from_submission(stamped));

    if (queue_.size() >= config_.batch_size) {
        flush();
    }
    return true;
}

void Collector::enqueue(QueuedRecord record) {
    while (!queue_.push(std::move(record))) {
        LOG_EVERY_N(WARNING, 100) << "Submission queue full (" << queue_.max_depth()
                                  << " records), flushing synchronously";
        flush();
    }
}

void Collector::reject(std::atomic<uint64_t>& counter, std::string reason) {
    counter++;
    VLOG(1) << "Rejected comparison for domain '" << domain_ << "': " << reason;

    std::lock_guard<std::mutex> lock(reason_mutex_);
    last_rejection_reason_ = std::move(reason);
}

size_t Collector::flush() {
    std::lock_guard<std::mutex> lock(flush_mutex_);

    size_t sent = 0;
    size_t attempted = 0;
    while (auto record = queue_.try_pop()) {
        ++attempted;
        if (send_one(*record)) {
            submitted_++;
            ++sent;
        } else {
            failed_++;
        }
    }

    if (attempted > 0) {
        VLOG(1) << "Flushed " << attempted << " records: " << sent << " sent, "
                << (attempted - sent) << " failed";
    }
    return sent;
}

bool Collector::send_one(const QueuedRecord& record) {
    try {
        SendResult result = client_->send(record.to_payload());
        if (!result.success) {
            LOG_EVERY_N(WARNING, 100) << "Failed to submit preference ("
                                      << google::COUNTER << " total): "
                                      << result.error.value_or("unknown error");
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Failed to submit preference: " << e.what();
        return false;
    }
}

void Collector::stop() {
    const bool already_stopped = stopped_.exchange(true);

    if (flusher_) {
        flusher_->stop();
    }

    // Final drain, also for records submitted after an earlier stop()
    flush();
    if (already_stopped) {
        return;
    }

    CollectorStats s = stats();
    LOG(INFO) << "Collector for domain '" << domain_ << "' stopped. Stats: collected="
              << s.collected << " submitted=" << s.submitted
              << " rejected_quality=" << s.rejected_quality
              << " rejected_duplicate=" << s.rejected_duplicate
              << " failed=" << s.failed
              << " acceptance=" << std::fixed << std::setprecision(1)
              << (s.acceptance_rate() * 100.0) << "%";
}

CollectorStats Collector::stats() const {
    CollectorStats s;
    s.collected = collected_;
    s.submitted = submitted_;
    s.rejected_quality = rejected_quality_;
    s.rejected_duplicate = rejected_duplicate_;
    s.failed = failed_;
    s.queue_depth = queue_.size();
    return s;
}

std::string Collector::last_rejection_reason() const {
    std::lock_guard<std::mutex> lock(reason_mutex_);
    return last_rejection_reason_;
}

}  // namespace prefcol::pipeline
