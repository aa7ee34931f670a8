//
//  segment_planner.cpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "segment_planner.hpp"

#include <sstream>

#include "logging.hpp"
#include "sanitizer.hpp"
#include "tracklist_parser.hpp"

namespace tracksplit {

PlanResult plan_segments(const std::vector<TracklistEntry> &entries, Duration source_duration) {
    PlanResult res;
    if (entries.empty()) {
        res.status = make_error(ErrorKind::Parse, "no valid timestamp lines");
        return res;
    }

    const auto &last = entries.back();
    if (last.offset >= source_duration) {
        std::ostringstream oss;
        oss << "line " << last.source_line << ": track '" << last.label << "' starts at "
            << format_timestamp(last.offset) << " but the source is only "
            << format_timestamp(source_duration) << " long";
        TS_LOG("error", oss.str());
        res.status = make_error(ErrorKind::Range, oss.str());
        return res;
    }

    if (entries.front().offset != Duration::zero()) {
        TS_LOG("info", "first track starts at " << format_timestamp(entries.front().offset)
                                                << "; audio before it is not exported");
    }

    TrackNamer namer(entries.size());
    res.segments.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        Segment seg;
        seg.index = i;
        seg.start = entries[i].offset;
        seg.end = (i + 1 < entries.size()) ? entries[i + 1].offset : source_duration;
        seg.source_line = entries[i].source_line;
        if (seg.end <= seg.start) {
            std::ostringstream oss;
            oss << "line " << entries[i + 1].source_line << " does not start after line "
                << seg.source_line;
            res.segments.clear();
            res.status = make_error(ErrorKind::Order, oss.str());
            return res;
        }
        seg.name = namer.name_for(i, entries[i].label);
        res.segments.push_back(std::move(seg));
    }
    TS_LOG("debug", "planned " << res.segments.size() << " segments over "
                               << format_timestamp(source_duration));
    return res;
}

}  // namespace tracksplit
