//
//  batch_report.hpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tracklist_entry.hpp"

namespace tracksplit {

enum class ExportOutcome { Success, Failure, Cancelled };

/// Terminal outcome of exporting one segment.
struct ExportResult {
    Segment segment;
    ExportOutcome outcome = ExportOutcome::Cancelled;
    std::string path;    ///< written file (Success)
    std::string reason;  ///< why it failed or was skipped

    bool succeeded() const { return outcome == ExportOutcome::Success; }
};

/// Per-segment results of one run, in segment index order.
struct BatchReport {
    std::vector<ExportResult> results;
    std::optional<ExportResult> original;  ///< set when keep_original was requested

    size_t succeeded() const;
    size_t failed() const;
    size_t cancelled() const;
};

const char *outcome_name(ExportOutcome outcome);

// 0 when every segment succeeded, 4 when none did, 3 otherwise. Cancelled segments count as
// not succeeded. The original's result does not take part.
int exit_code_for(const BatchReport &report);

nlohmann::json report_to_json(const BatchReport &report);

// Human readable listing of every segment and its outcome.
void print_summary(std::ostream &out, const BatchReport &report);

}  // namespace tracksplit
