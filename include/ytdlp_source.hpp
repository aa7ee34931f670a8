//
//  ytdlp_source.hpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

#include "audio_source.hpp"

namespace tracksplit {

inline constexpr const char *kYtDlpEnv = "TRACKSPLIT_YTDLP";

/**
 * @brief Downloads the best audio stream with yt-dlp, converted to WAV, and decodes it.
 *
 * The download lands in a private directory under `work_root` that is removed once the
 * samples are in memory.
 */
class YtDlpAudioSource : public AudioSource {
public:
    explicit YtDlpAudioSource(const std::atomic<bool> *abort = nullptr,
                              std::filesystem::path work_root = {});

    FetchResult fetch_and_decode(const std::string &url) override;

    // Command line passed to yt-dlp (exposed for tests/logging).
    static std::vector<std::string> build_args(const std::string &url,
                                               const std::filesystem::path &work_dir);

private:
    const std::atomic<bool> *abort_;
    std::filesystem::path work_root_;
    std::string program_;
};

}  // namespace tracksplit
