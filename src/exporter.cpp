//
//  exporter.cpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "exporter.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <system_error>
#include <thread>

#include "file_utils.hpp"
#include "logging.hpp"
#include "tracklist_parser.hpp"

namespace tracksplit {

namespace {

constexpr const char *kOriginalName = "original";

bool aborted(const std::atomic<bool> *flag) { return flag != nullptr && flag->load(); }

}  // namespace

namespace exporter_detail {

unsigned run_workers(unsigned workers, const std::function<void()> &work,
                     const ThreadStarter &start) {
    if (workers <= 1) {
        work();
        return 0;
    }
    std::vector<std::thread> pool;
    pool.reserve(workers);
    bool short_handed = false;
    for (unsigned w = 0; w < workers; ++w) {
        try {
            pool.push_back(start ? start(work) : std::thread(work));
        } catch (const std::system_error &e) {
            TS_LOG("warn", "could not start export worker " << w + 1 << " (" << e.what()
                                                            << "); continuing with "
                                                            << pool.size() << " workers");
            short_handed = true;
            break;
        }
    }
    // Started threads must be joined even when the pool came up short.
    if (short_handed) {
        work();
    }
    for (auto &t : pool) {
        t.join();
    }
    return static_cast<unsigned>(pool.size());
}

}  // namespace exporter_detail

Exporter::Exporter(const Config &config, const Encoder &encoder, const std::atomic<bool> *abort)
    : config_(config), encoder_(encoder), abort_(abort) {}

unsigned Exporter::worker_count(size_t segment_count) const {
    unsigned n = config_.jobs;
    if (n == 0) {
        n = std::max(1u, std::thread::hardware_concurrency());
    }
    return static_cast<unsigned>(std::min<size_t>(n, std::max<size_t>(1, segment_count)));
}

ExportResult Exporter::export_one(const PcmBuffer &source, const Segment &segment) const {
    ExportResult r;
    r.segment = segment;
    const auto dest = config_.output_dir / (segment.name + "." + encoder_.extension());
    TS_LOG("info", "track " << segment.index + 1 << ": " << segment.name << " ["
                            << format_timestamp(segment.start) << " - "
                            << format_timestamp(segment.end) << "]");
    Status st;
    try {
        st = encoder_.encode(source, source.range_for(segment.start, segment.end),
                             config_.quality_kbps, dest);
    } catch (const std::exception &e) {
        st = make_error(ErrorKind::Encode, e.what());
    }
    if (st.ok) {
        r.outcome = ExportOutcome::Success;
        r.path = dest.string();
    } else {
        r.outcome = ExportOutcome::Failure;
        r.reason = st.message;
        TS_LOG("warn", "track " << segment.index + 1 << " failed: " << st.message);
    }
    return r;
}

ExportResult Exporter::export_original(const PcmBuffer &source) const {
    ExportResult r;
    r.segment.name = kOriginalName;
    r.segment.end = source.duration();
    if (aborted(abort_)) {
        r.reason = "interrupted";
        return r;
    }
    const auto dest = config_.output_dir / (std::string(kOriginalName) + "." + encoder_.extension());
    Status st;
    try {
        st = encoder_.encode(source, source.all(), config_.quality_kbps, dest);
    } catch (const std::exception &e) {
        st = make_error(ErrorKind::Encode, e.what());
    }
    if (st.ok) {
        r.outcome = ExportOutcome::Success;
        r.path = dest.string();
        TS_LOG("info", "original kept at " << r.path);
    } else {
        r.outcome = ExportOutcome::Failure;
        r.reason = st.message;
        TS_LOG("warn", "could not keep original: " << st.message);
    }
    return r;
}

BatchReport Exporter::export_segments(const PcmBuffer &source,
                                      const std::vector<Segment> &segments) const {
    const auto t0 = std::chrono::steady_clock::now();
    BatchReport report;
    report.results.resize(segments.size());
    for (size_t i = 0; i < segments.size(); ++i) {
        report.results[i].segment = segments[i];
        report.results[i].reason = "interrupted before export started";
    }

    Status dir = ensure_dir(config_.output_dir);
    if (!dir.ok) {
        for (auto &r : report.results) {
            r.outcome = ExportOutcome::Failure;
            r.reason = dir.message;
        }
        if (config_.keep_original) {
            ExportResult o;
            o.segment.name = kOriginalName;
            o.outcome = ExportOutcome::Failure;
            o.reason = dir.message;
            report.original = o;
        }
        return report;
    }

    // Workers share the read-only source; each writes only its own result slot.
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (;;) {
            if (aborted(abort_)) {
                return;
            }
            const size_t i = next.fetch_add(1);
            if (i >= segments.size()) {
                return;
            }
            report.results[i] = export_one(source, segments[i]);
        }
    };

    const unsigned workers = worker_count(segments.size());
    TS_LOG("debug", "exporting " << segments.size() << " segments with " << workers
                                 << " workers");
    exporter_detail::run_workers(workers, worker);

    if (config_.keep_original) {
        report.original = export_original(source);
    }

    if (report.cancelled() > 0) {
        TS_LOG("warn", "interrupted: " << report.cancelled() << " of " << segments.size()
                                       << " tracks were not exported");
    }
    const auto t1 = std::chrono::steady_clock::now();
    TS_LOG("debug", "export finished in "
                        << std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count()
                        << " ms");
    return report;
}

}  // namespace tracksplit
