// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file submission_queue.hpp
/// @brief Thread-safe FIFO of accepted records awaiting transmission

#include "comparison.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace prefcol::pipeline {

/// Mutex-protected FIFO shared by producers (push) and flushes (pop).
class SubmissionQueue {
public:
    /// @param max_depth Capacity, 0 for unbounded
    explicit SubmissionQueue(size_t max_depth = 0);

    SubmissionQueue(const SubmissionQueue&) = delete;
    SubmissionQueue& operator=(const SubmissionQueue&) = delete;

    /// Append a record
    /// @return false if the queue is at capacity (record left untouched)
    bool push(QueuedRecord&& record);

    /// Remove and return the oldest record, nullopt if empty
    std::optional<QueuedRecord> try_pop();

    size_t size() const;
    bool empty() const;
    bool full() const;
    size_t max_depth() const { return max_depth_; }

    /// Drop all queued records
    /// @return number of records dropped
    size_t clear();

private:
    size_t max_depth_;
    mutable std::mutex mutex_;
    std::deque<QueuedRecord> records_;
};

}  // namespace prefcol::pipeline
