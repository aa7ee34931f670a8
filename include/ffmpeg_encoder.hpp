//
//  ffmpeg_encoder.hpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "audio_source.hpp"

namespace tracksplit {

inline constexpr const char *kFfmpegEnv = "TRACKSPLIT_FFMPEG";

/// MP3 encoder backed by the ffmpeg command line tool (libmp3lame, constant bitrate).
class FfmpegEncoder : public Encoder {
public:
    FfmpegEncoder();

    std::string extension() const override { return "mp3"; }

    Status encode(const PcmBuffer &audio, FrameRange range, int quality_kbps,
                  const std::filesystem::path &dest) const override;

    static std::vector<std::string> build_args(const std::filesystem::path &input,
                                               int quality_kbps,
                                               const std::filesystem::path &output);

private:
    std::string program_;
};

}  // namespace tracksplit
