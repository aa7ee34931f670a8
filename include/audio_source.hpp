//
//  audio_source.hpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "pcm_buffer.hpp"
#include "status.hpp"

namespace tracksplit {

/// Outcome of acquiring the source; `audio` is set only when `status.ok`.
struct FetchResult {
    Status status;
    std::shared_ptr<const PcmBuffer> audio;

    Duration duration() const { return audio ? audio->duration() : Duration::zero(); }
};

/**
 * @brief Acquires and decodes the source audio.
 *
 * Called exactly once per run; the returned buffer is shared read-only by all exports.
 * Failures are reported as ErrorKind::Download.
 */
class AudioSource {
public:
    virtual ~AudioSource() = default;

    virtual FetchResult fetch_and_decode(const std::string &url) = 0;
};

/**
 * @brief Encodes one frame range of a decoded buffer into one output file.
 *
 * Must be callable from several threads at once for distinct destinations. On failure the
 * destination must not exist afterwards (no partially written files). Failures are reported
 * as ErrorKind::Encode.
 */
class Encoder {
public:
    virtual ~Encoder() = default;

    /// File extension (without dot) of the files this encoder writes, e.g. "mp3".
    virtual std::string extension() const = 0;

    virtual Status encode(const PcmBuffer &audio, FrameRange range, int quality_kbps,
                          const std::filesystem::path &dest) const = 0;
};

}  // namespace tracksplit
