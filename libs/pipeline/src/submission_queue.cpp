// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#include "submission_queue.hpp"

namespace prefcol::pipeline {

SubmissionQueue::SubmissionQueue(size_t max_depth)
    : max_depth_(max_depth) {
}

bool SubmissionQueue::push(QueuedRecord&& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (max_depth_ > 0 && records_.size() >= max_depth_) {
        return false;
    }
    records_.push_back(std::move(record));
    return true;
}

std::optional<QueuedRecord> SubmissionQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.empty()) {
        return std::nullopt;
    }
    QueuedRecord record = std::move(records_.front());
    records_.pop_front();
    return record;
}

size_t SubmissionQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

bool SubmissionQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.empty();
}

bool SubmissionQueue::full() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_depth_ > 0 && records_.size() >= max_depth_;
}

size_t SubmissionQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t dropped = records_.size();
    records_.clear();
    return dropped;
}

}  // namespace prefcol::pipeline
