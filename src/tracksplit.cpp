//
//  tracksplit.cpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "tracksplit.hpp"
#include "tracksplit_version.hpp"

#include <chrono>

#include "exporter.hpp"
#include "logging.hpp"
#include "segment_planner.hpp"
#include "tracklist_parser.hpp"

namespace tracksplit {

std::string version_string() { return TRACKSPLIT_VERSION_DISPLAY; }

namespace {

RunOutcome stop(RunOutcome out, const Status &status) {
    out.status = status;
    out.exit_code = exit_code_for(status.kind);
    return out;
}

RunOutcome run_parsed(RunOutcome out, const std::string &url, const Config &config,
                      AudioSource &source, const Encoder &encoder,
                      const std::atomic<bool> *abort) {
    const auto t0 = std::chrono::steady_clock::now();
    TS_LOG("info", "found " << out.entries.size() << " tracks");
    for (const auto &e : out.entries) {
        TS_LOG("info", "  " << format_timestamp(e.offset) << " - " << e.label);
    }

    if (abort != nullptr && abort->load()) {
        return stop(std::move(out), make_error(ErrorKind::Download, "interrupted before download"));
    }

    // The only acquisition of the run; every segment below reads from this buffer.
    FetchResult fetched = source.fetch_and_decode(url);
    if (!fetched.status.ok) {
        return stop(std::move(out), fetched.status);
    }
    if (!fetched.audio) {
        return stop(std::move(out), make_error(ErrorKind::Download, "source returned no audio"));
    }
    const auto t_fetch = std::chrono::steady_clock::now();

    PlanResult plan = plan_segments(out.entries, fetched.duration());
    if (!plan.status.ok) {
        return stop(std::move(out), plan.status);
    }

    Exporter exporter(config, encoder, abort);
    BatchReport report = exporter.export_segments(*fetched.audio, plan.segments);
    const auto t_export = std::chrono::steady_clock::now();
    TS_LOG("debug", "timings fetch="
                        << std::chrono::duration_cast<std::chrono::milliseconds>(t_fetch - t0)
                               .count()
                        << "ms export="
                        << std::chrono::duration_cast<std::chrono::milliseconds>(t_export -
                                                                                 t_fetch)
                               .count()
                        << "ms");

    out.exit_code = exit_code_for(report);
    if (out.exit_code != 0) {
        out.status = make_error(ErrorKind::Encode, std::to_string(report.results.size() -
                                                                  report.succeeded()) +
                                                       " of " +
                                                       std::to_string(report.results.size()) +
                                                       " tracks were not exported");
    }
    out.report = std::move(report);
    return out;
}

}  // namespace

RunOutcome split_tracks(const std::string &url, const std::string &tracklist_text,
                        const Config &config, AudioSource &source, const Encoder &encoder,
                        const std::atomic<bool> *abort) {
    RunOutcome out;
    TracklistResult parsed = parse_tracklist(tracklist_text);
    if (!parsed.status.ok) {
        TS_LOG("error", parsed.status.message);
        return stop(std::move(out), parsed.status);
    }
    out.entries = std::move(parsed.entries);
    return run_parsed(std::move(out), url, config, source, encoder, abort);
}

RunOutcome split_tracks_from_file(const std::string &url, const std::string &tracklist_path,
                                  const Config &config, AudioSource &source,
                                  const Encoder &encoder, const std::atomic<bool> *abort) {
    RunOutcome out;
    TracklistResult parsed = parse_tracklist_file(tracklist_path);
    if (!parsed.status.ok) {
        TS_LOG("error", parsed.status.message);
        return stop(std::move(out), parsed.status);
    }
    out.entries = std::move(parsed.entries);
    return run_parsed(std::move(out), url, config, source, encoder, abort);
}

}  // namespace tracksplit
