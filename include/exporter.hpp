//
//  exporter.hpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <functional>
#include <thread>
#include <vector>

#include "audio_source.hpp"
#include "batch_report.hpp"
#include "config.hpp"

namespace tracksplit {

namespace exporter_detail {
using ThreadStarter = std::function<std::thread(const std::function<void()> &)>;

// Runs `work` on `workers` threads and joins them all. If a thread cannot be started the
// calling thread runs `work` too. Returns the number of threads started; `start` defaults to
// plain std::thread construction.
unsigned run_workers(unsigned workers, const std::function<void()> &work,
                     const ThreadStarter &start = {});
}  // namespace exporter_detail

/**
 * @brief Writes one encoded file per planned segment from a single decoded source.
 *
 * Segments are encoded by a bounded pool of workers; each worker stores its result in the
 * slot of its segment index so the report comes back in order. A failing segment never stops
 * the others. Once `abort` is raised no further segment is started; segments already running
 * finish and those never started are reported as cancelled.
 */
class Exporter {
public:
    Exporter(const Config &config, const Encoder &encoder,
             const std::atomic<bool> *abort = nullptr);

    BatchReport export_segments(const PcmBuffer &source, const std::vector<Segment> &segments) const;

    // Number of workers used for `segment_count` segments.
    unsigned worker_count(size_t segment_count) const;

private:
    ExportResult export_one(const PcmBuffer &source, const Segment &segment) const;
    ExportResult export_original(const PcmBuffer &source) const;

    const Config &config_;
    const Encoder &encoder_;
    const std::atomic<bool> *abort_;
};

}  // namespace tracksplit
