//
//  batch_report.cpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "batch_report.hpp"

#include <algorithm>

#include "tracklist_parser.hpp"

using json = nlohmann::json;

namespace tracksplit {

namespace {

constexpr int kExitAllSucceeded = 0;
constexpr int kExitPartialFailure = 3;
constexpr int kExitAllFailed = 4;

size_t count_outcome(const std::vector<ExportResult> &results, ExportOutcome outcome) {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
                                             [outcome](const ExportResult &r) {
                                                 return r.outcome == outcome;
                                             }));
}

json result_to_json(const ExportResult &r) {
    json j;
    j["index"] = r.segment.index + 1;
    j["name"] = r.segment.name;
    j["start_ms"] = r.segment.start.count();
    j["end_ms"] = r.segment.end.count();
    j["outcome"] = outcome_name(r.outcome);
    if (!r.path.empty()) {
        j["path"] = r.path;
    }
    if (!r.reason.empty()) {
        j["reason"] = r.reason;
    }
    return j;
}

}  // namespace

size_t BatchReport::succeeded() const { return count_outcome(results, ExportOutcome::Success); }

size_t BatchReport::failed() const { return count_outcome(results, ExportOutcome::Failure); }

size_t BatchReport::cancelled() const { return count_outcome(results, ExportOutcome::Cancelled); }

const char *outcome_name(ExportOutcome outcome) {
    switch (outcome) {
        case ExportOutcome::Success:
            return "success";
        case ExportOutcome::Failure:
            return "failure";
        case ExportOutcome::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

int exit_code_for(const BatchReport &report) {
    const size_t ok = report.succeeded();
    if (ok == report.results.size()) {
        return kExitAllSucceeded;
    }
    return ok == 0 ? kExitAllFailed : kExitPartialFailure;
}

json report_to_json(const BatchReport &report) {
    json j;
    json segments = json::array();
    for (const auto &r : report.results) {
        segments.push_back(result_to_json(r));
    }
    j["segments"] = segments;
    if (report.original) {
        json o;
        o["outcome"] = outcome_name(report.original->outcome);
        if (!report.original->path.empty()) {
            o["path"] = report.original->path;
        }
        if (!report.original->reason.empty()) {
            o["reason"] = report.original->reason;
        }
        j["original"] = o;
    }
    j["total"] = report.results.size();
    j["succeeded"] = report.succeeded();
    j["failed"] = report.failed();
    j["cancelled"] = report.cancelled();
    j["exit_code"] = exit_code_for(report);
    return j;
}

void print_summary(std::ostream &out, const BatchReport &report) {
    for (const auto &r : report.results) {
        out << "  [" << format_timestamp(r.segment.start) << " - "
            << format_timestamp(r.segment.end) << "] " << r.segment.name << ": ";
        switch (r.outcome) {
            case ExportOutcome::Success:
                out << "ok -> " << r.path;
                break;
            case ExportOutcome::Failure:
                out << "FAILED (" << r.reason << ")";
                break;
            case ExportOutcome::Cancelled:
                out << "cancelled";
                break;
        }
        out << "\n";
    }
    if (report.original) {
        out << "  original: "
            << (report.original->succeeded() ? "ok -> " + report.original->path
                                             : "FAILED (" + report.original->reason + ")")
            << "\n";
    }
    out << report.succeeded() << "/" << report.results.size() << " tracks saved";
    if (report.failed() > 0) {
        out << ", " << report.failed() << " failed";
    }
    if (report.cancelled() > 0) {
        out << ", " << report.cancelled() << " cancelled";
    }
    out << "\n";
}

}  // namespace tracksplit
