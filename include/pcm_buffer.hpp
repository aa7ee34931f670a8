//
//  pcm_buffer.hpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <vector>

#include "tracklist_entry.hpp"

namespace tracksplit {

inline constexpr uint16_t kWaveFormatPcm = 0x0001;
inline constexpr uint16_t kWaveFormatFloat = 0x0003;
inline constexpr uint16_t kWaveFormatExtensible = 0xFFFE;

/// Sample layout of interleaved PCM data.
struct PcmFormat {
    uint16_t format_tag = kWaveFormatPcm;  ///< kWaveFormatPcm or kWaveFormatFloat
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;

    uint32_t block_align() const { return channels * ((bits_per_sample + 7u) / 8u); }
};

/// Frame interval [begin, end) within a PcmBuffer.
struct FrameRange {
    uint64_t begin = 0;
    uint64_t end = 0;

    uint64_t size() const { return end > begin ? end - begin : 0; }
};

/**
 * @brief Decoded source audio held in memory.
 *
 * Read-only once decoded; exporters slice it by frame range from several threads.
 */
struct PcmBuffer {
    PcmFormat format;
    std::vector<uint8_t> data;  ///< interleaved samples, little-endian as in WAVE

    uint64_t frames() const {
        const uint32_t align = format.block_align();
        return align == 0 ? 0 : data.size() / align;
    }

    Duration duration() const {
        if (format.sample_rate == 0) {
            return Duration::zero();
        }
        return Duration(static_cast<Duration::rep>(frames() * 1000 / format.sample_rate));
    }

    // Frame index of a time offset, clamped to the buffer. Offsets at or past duration()
    // map to the end so the last segment keeps the sub-millisecond tail.
    uint64_t frame_at(Duration t) const {
        if (t <= Duration::zero()) {
            return 0;
        }
        if (t >= duration()) {
            return frames();
        }
        const uint64_t f = static_cast<uint64_t>(t.count()) * format.sample_rate / 1000;
        return f < frames() ? f : frames();
    }

    FrameRange range_for(Duration start, Duration end) const {
        return FrameRange{frame_at(start), frame_at(end)};
    }

    FrameRange all() const { return FrameRange{0, frames()}; }
};

}  // namespace tracksplit
