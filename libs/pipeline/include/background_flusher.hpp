// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file background_flusher.hpp
/// @brief Timer-driven worker that periodically invokes a flush callback

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace prefcol::pipeline {

/// Single worker thread that sleeps for an interval, then flushes.
///
/// The sleep is a condition-variable wait, so stop() wakes the worker
/// immediately. A stop during the sleep exits without flushing; the owner is
/// expected to run its own final flush.
class BackgroundFlusher {
public:
    using FlushCallback = std::function<void()>;

    BackgroundFlusher(std::chrono::milliseconds interval, FlushCallback callback);
    ~BackgroundFlusher();

    BackgroundFlusher(const BackgroundFlusher&) = delete;
    BackgroundFlusher& operator=(const BackgroundFlusher&) = delete;

    /// Start the worker thread (no-op if already started)
    void start();

    /// Signal the worker and join it. Safe to call more than once.
    void stop();

    bool running() const { return running_; }

    /// Number of timer-triggered flushes performed
    uint64_t flush_count() const { return flush_count_; }

    std::chrono::milliseconds interval() const { return interval_; }

private:
    void run();

    std::chrono::milliseconds interval_;
    FlushCallback callback_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> flush_count_{0};

    std::mutex lifecycle_mutex_;  ///< Serializes start/stop

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::thread thread_;
};

}  // namespace prefcol::pipeline
