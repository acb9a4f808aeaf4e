// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#include "dedup_cache.hpp"
#include "text_utils.hpp"

#include <glog/logging.h>
#include <openssl/evp.h>

#include <algorithm>
#include <stdexcept>

namespace prefcol::pipeline {

namespace {

const char kHexDigits[] = "0123456789abcdef";

}  // namespace

DeduplicationCache::DeduplicationCache(size_t max_size)
    : max_size_(std::max<size_t>(max_size, 1)) {
}

std::string DeduplicationCache::content_hash(const ComparisonSubmission& submission) {
    const std::string content = submission.prompt + "|" +
        char_prefix(submission.response_a, kResponsePrefixChars) + "|" +
        char_prefix(submission.response_b, kResponsePrefixChars);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(content.data(), content.size(), digest, &digest_len,
                   EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::string hex;
    hex.reserve(kHashHexChars);
    for (unsigned int i = 0; i < digest_len && hex.size() < kHashHexChars; ++i) {
        hex += kHexDigits[digest[i] >> 4];
        hex += kHexDigits[digest[i] & 0x0F];
    }
    return hex;
}

bool DeduplicationCache::is_duplicate(const ComparisonSubmission& submission) {
    const std::string hash = content_hash(submission);

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(hash);
    if (it != index_.end()) {
        recency_.splice(recency_.begin(), recency_, it->second);
        return true;
    }

    if (index_.size() >= max_size_) {
        evict_oldest_half();
    }

    recency_.push_front(hash);
    index_.emplace(hash, recency_.begin());
    return false;
}

void DeduplicationCache::evict_oldest_half() {
    const size_t target = std::max<size_t>(max_size_ / 2, 1);
    size_t removed = 0;

    while (removed < target && !recency_.empty()) {
        index_.erase(recency_.back());
        recency_.pop_back();
        ++removed;
    }

    ++evictions_;
    VLOG(1) << "Dedup cache full, evicted " << removed << " oldest entries ("
            << index_.size() << " remain)";
}

size_t DeduplicationCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

size_t DeduplicationCache::evictions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evictions_;
}

void DeduplicationCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    recency_.clear();
    index_.clear();
}

}  // namespace prefcol::pipeline
