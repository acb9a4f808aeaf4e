// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#include "background_flusher.hpp"

#include <glog/logging.h>

namespace prefcol::pipeline {

BackgroundFlusher::BackgroundFlusher(std::chrono::milliseconds interval,
                                     FlushCallback callback)
    : interval_(interval)
    , callback_(std::move(callback)) {
}

BackgroundFlusher::~BackgroundFlusher() {
    stop();
}

void BackgroundFlusher::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }

    running_ = true;
    thread_ = std::thread(&BackgroundFlusher::run, this);

    VLOG(1) << "Background flusher started, interval " << interval_.count() << "ms";
}

void BackgroundFlusher::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;

    VLOG(1) << "Background flusher stopped after " << flush_count_ << " timed flushes";
}

void BackgroundFlusher::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        callback_();
        flush_count_++;
        lock.lock();
    }
}

}  // namespace prefcol::pipeline
