//
//  utf8.hpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace utf8 {

inline constexpr char32_t kReplacementChar = 0xFFFD;

// Decode one code point at `pos`, advancing `pos`. Malformed or overlong sequences and
// surrogates decode as U+FFFD consuming a single byte.
char32_t decode_next(std::string_view s, size_t &pos);

// Decode the whole string (invalid bytes become U+FFFD).
std::vector<char32_t> decode(std::string_view s);

// Number of bytes `append` writes for `cp`.
size_t encoded_size(char32_t cp);

void append(std::string &out, char32_t cp);

std::string encode(const std::vector<char32_t> &cps);

// True when `cp` never starts a new grapheme cluster when it follows `prev`
// (combining marks, variation selectors, ZWJ continuation, emoji modifiers, tags, jamo).
bool extends_cluster(char32_t prev, char32_t cp);

// Split decoded text into grapheme clusters, each given as [begin, end) indices.
std::vector<std::pair<size_t, size_t>> grapheme_clusters(const std::vector<char32_t> &cps);

}  // namespace utf8
