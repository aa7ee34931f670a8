//
//  wav_codec.hpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pcm_buffer.hpp"

namespace tracksplit {

struct WavDecodeResult {
    bool ok{false};
    std::string message;  ///< why decoding failed
    PcmBuffer audio;
};

// Decode RIFF/WAVE bytes (PCM int 8/16/24/32, IEEE float 32/64, extensible) into memory.
WavDecodeResult decode_wav(std::vector<uint8_t> bytes);

// Read and decode a WAVE file.
WavDecodeResult read_wav_file(const std::string &path);

// Serialize the frames in `range` as a canonical 44-byte-header WAVE file.
std::vector<uint8_t> encode_wav(const PcmBuffer &audio, FrameRange range);

// Utility: read little-endian values from a byte buffer (no bounds check).
uint16_t read_u16_le(const uint8_t *p);
uint32_t read_u32_le(const uint8_t *p);

}  // namespace tracksplit
