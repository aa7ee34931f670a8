//
//  tracklist_parser.hpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "status.hpp"
#include "tracklist_entry.hpp"

namespace tracksplit {

/**
 * @brief Parsed tracklist or the first problem found.
 *
 * On failure `entries` is empty, `error_line` names the offending 1-based line (0 when the
 * problem is not tied to a line) and, for order errors, `conflict_line` names the earlier
 * line it clashes with.
 */
struct TracklistResult {
    Status status;
    std::vector<TracklistEntry> entries;
    int error_line = 0;
    int conflict_line = 0;
};

/// Parse tracklist text: one `<time> <sep> <label>` per line, `#` comments, blank lines.
TracklistResult parse_tracklist(std::string_view text);

/// Read a UTF-8 tracklist file and parse it.
TracklistResult parse_tracklist_file(const std::string &path);

/// Format an offset as `H:MM:SS`.
std::string format_timestamp(Duration offset);

namespace parser_detail {
struct TimeToken {
    Duration offset{0};
    size_t length = 0;  // bytes consumed from the line
};

// Scan the time token at the start of `line`. Returns nullopt and fills `error` when the
// leading digits do not form a valid token.
std::optional<TimeToken> scan_time_token(std::string_view line, std::string &error);
}  // namespace parser_detail

}  // namespace tracksplit
