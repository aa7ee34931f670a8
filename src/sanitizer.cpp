//
//  sanitizer.cpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "sanitizer.hpp"

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <vector>

#include "logging.hpp"
#include "utf8.hpp"

namespace tracksplit {

namespace {

constexpr size_t kMinIndexWidth = 2;

bool is_illegal(char32_t cp) {
    switch (cp) {
        case U'/':
        case U'\\':
        case U':':
        case U'*':
        case U'?':
        case U'"':
        case U'<':
        case U'>':
        case U'|':
            return true;
        default:
            break;
    }
    // C0, DEL and C1 controls.
    return cp < 0x20 || (cp >= 0x7F && cp <= 0x9F);
}

bool is_space(char32_t cp) {
    return cp == U' ' || cp == U'\t' || cp == 0x00A0 || cp == 0x1680 ||
           (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 || cp == 0x2029 || cp == 0x202F ||
           cp == 0x205F || cp == 0x3000;
}

std::string ascii_lower(const std::string &s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });
    return out;
}

}  // namespace

std::string sanitize_label(std::string_view raw, size_t max_code_points, size_t max_bytes) {
    std::vector<char32_t> cps = utf8::decode(raw);

    // Replace illegal characters and fold every whitespace run into one ASCII space.
    std::vector<char32_t> cleaned;
    cleaned.reserve(cps.size());
    for (char32_t cp : cps) {
        if (is_illegal(cp) || is_space(cp)) {
            if (!cleaned.empty() && cleaned.back() != U' ') {
                cleaned.push_back(U' ');
            }
            continue;
        }
        cleaned.push_back(cp);
    }

    // Dots and spaces at either end are troublesome on several filesystems.
    auto strip = [](std::vector<char32_t> &v) {
        auto is_edge = [](char32_t cp) { return cp == U' ' || cp == U'.'; };
        while (!v.empty() && is_edge(v.back())) {
            v.pop_back();
        }
        auto first = std::find_if_not(v.begin(), v.end(), is_edge);
        v.erase(v.begin(), first);
    };
    strip(cleaned);

    size_t total_bytes = 0;
    for (char32_t cp : cleaned) {
        total_bytes += utf8::encoded_size(cp);
    }
    if (cleaned.size() > max_code_points || total_bytes > max_bytes) {
        std::vector<char32_t> truncated;
        size_t bytes = 0;
        for (const auto &[begin, end] : utf8::grapheme_clusters(cleaned)) {
            size_t cluster_bytes = 0;
            for (size_t i = begin; i < end; ++i) {
                cluster_bytes += utf8::encoded_size(cleaned[i]);
            }
            if (end > max_code_points || bytes + cluster_bytes > max_bytes) {
                break;
            }
            bytes += cluster_bytes;
            truncated.insert(truncated.end(), cleaned.begin() + static_cast<std::ptrdiff_t>(begin),
                             cleaned.begin() + static_cast<std::ptrdiff_t>(end));
        }
        TS_LOG("debug", "label truncated from " << cleaned.size() << " code points ("
                                                << total_bytes << " bytes) to "
                                                << truncated.size() << " (" << bytes
                                                << " bytes)");
        cleaned = std::move(truncated);
        strip(cleaned);
    }
    return utf8::encode(cleaned);
}

size_t index_width(size_t count) {
    size_t digits = 1;
    for (size_t n = count; n >= 10; n /= 10) {
        ++digits;
    }
    return std::max(kMinIndexWidth, digits);
}

TrackNamer::TrackNamer(size_t count) : width_(index_width(count)) {}

std::string TrackNamer::name_for(size_t index, std::string_view raw_label) {
    std::string label = sanitize_label(raw_label);
    if (label.empty()) {
        label = "Track " + std::to_string(index + 1);
    }
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(static_cast<int>(width_)) << (index + 1) << " - "
        << label;
    return claim(oss.str());
}

std::string TrackNamer::claim(const std::string &name) {
    std::string candidate = name;
    for (size_t n = 2; used_.count(ascii_lower(candidate)) != 0; ++n) {
        candidate = name + " (" + std::to_string(n) + ")";
    }
    if (candidate != name) {
        TS_LOG("info", "name '" << name << "' already used; writing '" << candidate << "'");
    }
    used_.insert(ascii_lower(candidate));
    return candidate;
}

}  // namespace tracksplit
