//
//  tracksplit.hpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "audio_source.hpp"
#include "batch_report.hpp"
#include "config.hpp"
#include "status.hpp"
#include "tracklist_entry.hpp"

namespace tracksplit {

/// @defgroup api TrackSplit Public API
/// Public, supported C++ interfaces for splitting one source into labeled tracks.
/// @{

/**
 * @brief Return the TrackSplit version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/**
 * @brief Result of one complete run.
 *
 * `status` carries the first fatal error (parse/order/range/download); `report` is present
 * whenever planning succeeded, even if every export failed. `exit_code` follows the CLI
 * contract: 0 ok, 1 validation, 2 download, 3 partial failure, 4 all exports failed.
 */
struct RunOutcome {
    Status status;
    std::vector<TracklistEntry> entries;
    std::optional<BatchReport> report;
    int exit_code = 0;
};

/**
 * @brief Split the audio behind `url` into one file per tracklist entry.
 *
 * @param url Source location handed to `source`.
 * @param tracklist_text Tracklist contents (validated before any download).
 * @param config Output directory, bitrate and keep-original flag.
 * @param source Acquires and decodes the source; called at most once.
 * @param encoder Writes each segment.
 * @param abort Optional interrupt flag; stops dispatching new work when raised.
 */
RunOutcome split_tracks(const std::string &url, const std::string &tracklist_text,
                        const Config &config, AudioSource &source, const Encoder &encoder,
                        const std::atomic<bool> *abort = nullptr);  ///< @ingroup api

/// @overload reads the tracklist from a file.
RunOutcome split_tracks_from_file(const std::string &url, const std::string &tracklist_path,
                                  const Config &config, AudioSource &source,
                                  const Encoder &encoder,
                                  const std::atomic<bool> *abort = nullptr);  ///< @ingroup api

/// @}

}  // namespace tracksplit
