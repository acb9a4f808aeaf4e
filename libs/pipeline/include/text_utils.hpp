// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file text_utils.hpp
/// @brief Character-level helpers for UTF-8 text
///
/// Lengths and prefixes in the pipeline are measured in characters
/// (code points), not bytes, so that multi-byte text is judged the same
/// way as ASCII.

#include <cstddef>
#include <string>

namespace prefcol::pipeline {

/// Number of UTF-8 code points in text (continuation bytes not counted)
size_t char_length(const std::string& text);

/// First max_chars code points of text
std::string char_prefix(const std::string& text, size_t max_chars);

/// Text with leading and trailing ASCII whitespace removed
std::string trim(const std::string& text);

/// Lower-cased copy (ASCII only)
std::string to_lower(const std::string& text);

}  // namespace prefcol::pipeline
