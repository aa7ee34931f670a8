//
//  tracklist_entry.hpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <chrono>
#include <string>

namespace tracksplit {

using Duration = std::chrono::milliseconds;

/// One parsed timestamp/label pair.
struct TracklistEntry {
    Duration offset{0};   ///< Time from the start of the source
    std::string label;    ///< UTF-8 label as written (trimmed, not sanitized)
    int source_line = 0;  ///< 1-based line in the tracklist text
};

/// One half-open interval [start, end) of the source, destined for one output file.
struct Segment {
    size_t index = 0;  ///< 0-based rank in the entry sequence
    Duration start{0};
    Duration end{0};
    std::string name;  ///< Sanitized file name without extension
    int source_line = 0;
};

}  // namespace tracksplit
