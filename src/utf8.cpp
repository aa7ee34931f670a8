//
//  utf8.cpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "utf8.hpp"

#include <utility>

namespace utf8 {

namespace {

constexpr char32_t kZeroWidthJoiner = 0x200D;
constexpr char32_t kMaxCodePoint = 0x10FFFF;

struct Range {
    char32_t lo;
    char32_t hi;
};

// Code points that attach to the preceding character: nonspacing/spacing marks of the
// common scripts, joiners, variation selectors, emoji modifiers, tag characters and
// conjoining Hangul vowels/trailing consonants.
constexpr Range kExtendRanges[] = {
    {0x0300, 0x036F},   {0x0483, 0x0489},   {0x0591, 0x05BD},   {0x05BF, 0x05BF},
    {0x05C1, 0x05C2},   {0x05C4, 0x05C5},   {0x05C7, 0x05C7},   {0x0610, 0x061A},
    {0x064B, 0x065F},   {0x0670, 0x0670},   {0x06D6, 0x06DC},   {0x06DF, 0x06E4},
    {0x06E7, 0x06E8},   {0x06EA, 0x06ED},   {0x0900, 0x0903},   {0x093A, 0x093C},
    {0x093E, 0x094F},   {0x0951, 0x0957},   {0x0962, 0x0963},   {0x0981, 0x0983},
    {0x09BC, 0x09BC},   {0x09BE, 0x09CD},   {0x0E31, 0x0E31},   {0x0E34, 0x0E3A},
    {0x0E47, 0x0E4E},   {0x1160, 0x11FF},   {0x1AB0, 0x1AFF},   {0x1DC0, 0x1DFF},
    {0x200C, 0x200D},   {0x20D0, 0x20FF},   {0x302A, 0x302F},   {0x3099, 0x309A},
    {0xD7B0, 0xD7FF},   {0xFE00, 0xFE0F},   {0xFE20, 0xFE2F},   {0x1F3FB, 0x1F3FF},
    {0xE0020, 0xE007F}, {0xE0100, 0xE01EF},
};

bool in_ranges(char32_t cp) {
    for (const auto &r : kExtendRanges) {
        if (cp >= r.lo && cp <= r.hi) {
            return true;
        }
    }
    return false;
}

bool is_regional_indicator(char32_t cp) { return cp >= 0x1F1E6 && cp <= 0x1F1FF; }

bool is_continuation(unsigned char b) { return (b & 0xC0) == 0x80; }

}  // namespace

char32_t decode_next(std::string_view s, size_t &pos) {
    const auto lead = static_cast<unsigned char>(s[pos]);
    if (lead < 0x80) {
        ++pos;
        return lead;
    }
    size_t len = 0;
    char32_t cp = 0;
    char32_t min = 0;
    if ((lead & 0xE0) == 0xC0) {
        len = 2;
        cp = lead & 0x1F;
        min = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        cp = lead & 0x0F;
        min = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        cp = lead & 0x07;
        min = 0x10000;
    } else {
        ++pos;
        return kReplacementChar;
    }
    if (pos + len > s.size()) {
        ++pos;
        return kReplacementChar;
    }
    for (size_t i = 1; i < len; ++i) {
        const auto b = static_cast<unsigned char>(s[pos + i]);
        if (!is_continuation(b)) {
            ++pos;
            return kReplacementChar;
        }
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min || cp > kMaxCodePoint || (cp >= 0xD800 && cp <= 0xDFFF)) {
        ++pos;
        return kReplacementChar;
    }
    pos += len;
    return cp;
}

std::vector<char32_t> decode(std::string_view s) {
    std::vector<char32_t> out;
    out.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size()) {
        out.push_back(decode_next(s, pos));
    }
    return out;
}

size_t encoded_size(char32_t cp) {
    if (cp < 0x80) {
        return 1;
    }
    if (cp < 0x800) {
        return 2;
    }
    return cp < 0x10000 ? 3 : 4;
}

void append(std::string &out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string encode(const std::vector<char32_t> &cps) {
    std::string out;
    out.reserve(cps.size());
    for (char32_t cp : cps) {
        append(out, cp);
    }
    return out;
}

bool extends_cluster(char32_t prev, char32_t cp) {
    return prev == kZeroWidthJoiner || in_ranges(cp);
}

std::vector<std::pair<size_t, size_t>> grapheme_clusters(const std::vector<char32_t> &cps) {
    std::vector<std::pair<size_t, size_t>> clusters;
    size_t begin = 0;
    size_t ri_run = 0;  // regional indicators in the current cluster
    for (size_t i = 0; i < cps.size(); ++i) {
        bool joins = false;
        if (i > 0) {
            if (is_regional_indicator(cps[i]) && is_regional_indicator(cps[i - 1])) {
                joins = (ri_run % 2) == 1;
            } else {
                joins = extends_cluster(cps[i - 1], cps[i]);
            }
        }
        if (!joins) {
            if (i > 0) {
                clusters.emplace_back(begin, i);
            }
            begin = i;
            ri_run = 0;
        }
        if (is_regional_indicator(cps[i])) {
            ++ri_run;
        }
    }
    if (!cps.empty()) {
        clusters.emplace_back(begin, cps.size());
    }
    return clusters;
}

}  // namespace utf8
