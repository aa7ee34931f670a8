//
//  sanitizer.hpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <set>
#include <string>
#include <string_view>

namespace tracksplit {

inline constexpr size_t kMaxLabelCodePoints = 100;
// Leaves room under NAME_MAX (255) for the index prefix, a collision suffix and the
// longest temporary suffix (".mp3.input.wav").
inline constexpr size_t kMaxLabelBytes = 200;

/**
 * @brief Make a label safe for use in a file name.
 *
 * Trims, replaces `/ \ : * ? " < > |` and control characters with a space, collapses
 * whitespace, strips leading/trailing dots and truncates to `max_code_points` and
 * `max_bytes` of UTF-8 without splitting a grapheme cluster. May return an empty string.
 */
std::string sanitize_label(std::string_view raw, size_t max_code_points = kMaxLabelCodePoints,
                           size_t max_bytes = kMaxLabelBytes);

/// Number of decimal digits used for the index prefix of a run with `count` tracks (min 2).
size_t index_width(size_t count);

/**
 * @brief Produces the ordered, collision-free output names for one run.
 *
 * `name_for(i, label)` yields `"<NN> - <sanitized label>"`, falling back to `Track <i+1>` for
 * labels that sanitize to nothing. Names already handed out (ignoring ASCII case) get a
 * ` (2)`, ` (3)`, ... suffix.
 */
class TrackNamer {
public:
    explicit TrackNamer(size_t count);

    std::string name_for(size_t index, std::string_view raw_label);

    // Reserve an arbitrary name and return the unique variant.
    std::string claim(const std::string &name);

private:
    size_t width_;
    std::set<std::string> used_;
};

}  // namespace tracksplit
