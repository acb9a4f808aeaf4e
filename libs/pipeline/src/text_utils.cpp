// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#include "text_utils.hpp"

#include <algorithm>
#include <cctype>

namespace prefcol::pipeline {

namespace {

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

bool is_space(unsigned char c) {
    return std::isspace(c) != 0;
}

}  // namespace

size_t char_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if (!is_continuation(c)) {
            ++count;
        }
    }
    return count;
}

std::string char_prefix(const std::string& text, size_t max_chars) {
    size_t chars = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        if (!is_continuation(static_cast<unsigned char>(text[pos]))) {
            if (chars == max_chars) {
                break;
            }
            ++chars;
        }
        ++pos;
    }
    return text.substr(0, pos);
}

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(),
                                  [](char c) { return is_space(static_cast<unsigned char>(c)); });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
                                [](char c) { return is_space(static_cast<unsigned char>(c)); }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string to_lower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

}  // namespace prefcol::pipeline
