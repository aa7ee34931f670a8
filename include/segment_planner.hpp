//
//  segment_planner.hpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <vector>

#include "status.hpp"
#include "tracklist_entry.hpp"

namespace tracksplit {

struct PlanResult {
    Status status;
    std::vector<Segment> segments;
};

// Derive gap-free segments from sorted entry offsets. Each segment ends where the next
// entry starts; the last one ends at `source_duration`. Content before the first entry is
// not covered. Fails with ErrorKind::Range when the last entry does not start before
// `source_duration`.
PlanResult plan_segments(const std::vector<TracklistEntry> &entries, Duration source_duration);

}  // namespace tracksplit
