// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file dedup_cache.hpp
/// @brief Bounded LRU set of content hashes for duplicate suppression
///
/// The content hash covers the full prompt and the first 100 characters of
/// each response, so near-duplicates that only differ in their tails are
/// treated as the same comparison.

#include "comparison.hpp"

#include <cstddef>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

namespace prefcol::pipeline {

/// Thread-safe bounded duplicate detector.
///
/// When an insertion would exceed max_size, the least recently seen half of
/// the entries is evicted first. A hit refreshes the entry's recency.
class DeduplicationCache {
public:
    static constexpr size_t kDefaultMaxSize = 10000;
    static constexpr size_t kResponsePrefixChars = 100;
    static constexpr size_t kHashHexChars = 16;

    explicit DeduplicationCache(size_t max_size = kDefaultMaxSize);

    DeduplicationCache(const DeduplicationCache&) = delete;
    DeduplicationCache& operator=(const DeduplicationCache&) = delete;

    /// Check and record a submission atomically.
    /// @return true if the content hash was already present (not re-inserted),
    ///         false if it was new (now inserted)
    bool is_duplicate(const ComparisonSubmission& submission);

    /// Fixed-width hex content hash for a submission
    static std::string content_hash(const ComparisonSubmission& submission);

    size_t size() const;
    size_t max_size() const { return max_size_; }

    /// Number of evictions performed so far
    size_t evictions() const;

    void clear();

private:
    void evict_oldest_half();

    size_t max_size_;

    mutable std::mutex mutex_;
    std::list<std::string> recency_;  ///< front = most recently seen
    std::unordered_map<std::string, std::list<std::string>::iterator> index_;
    size_t evictions_ = 0;
};

}  // namespace prefcol::pipeline
