//
//  ytdlp_source.cpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "ytdlp_source.hpp"

#include <chrono>
#include <system_error>

#include <unistd.h>

#include "child_process.hpp"
#include "file_utils.hpp"
#include "logging.hpp"
#include "tracklist_parser.hpp"
#include "wav_codec.hpp"

namespace tracksplit {

namespace {

constexpr int kWorkDirAttempts = 16;

FetchResult download_error(std::string msg) {
    TS_LOG("error", msg);
    FetchResult res;
    res.status = make_error(ErrorKind::Download, std::move(msg));
    return res;
}

bool make_work_dir(const std::filesystem::path &root, std::filesystem::path &out) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    for (int i = 0; i < kWorkDirAttempts; ++i) {
        auto candidate = root / ("tracksplit-" + std::to_string(getpid()) + "-" +
                                 std::to_string(stamp) + "-" + std::to_string(i));
        std::error_code ec;
        if (std::filesystem::create_directory(candidate, ec) && !ec) {
            out = candidate;
            return true;
        }
    }
    return false;
}

}  // namespace

YtDlpAudioSource::YtDlpAudioSource(const std::atomic<bool> *abort,
                                   std::filesystem::path work_root)
    : abort_(abort), work_root_(std::move(work_root)),
      program_(program_from_env(kYtDlpEnv, "yt-dlp")) {
    if (work_root_.empty()) {
        std::error_code ec;
        work_root_ = std::filesystem::temp_directory_path(ec);
        if (ec) {
            work_root_ = ".";
        }
    }
}

std::vector<std::string> YtDlpAudioSource::build_args(const std::string &url,
                                                      const std::filesystem::path &work_dir) {
    return {"--no-playlist",
            "--no-part",
            "-f",
            "bestaudio/best",
            "--extract-audio",
            "--audio-format",
            "wav",
            "-o",
            (work_dir / "source.%(ext)s").string(),
            "--",
            url};
}

FetchResult YtDlpAudioSource::fetch_and_decode(const std::string &url) {
    const auto t0 = std::chrono::steady_clock::now();
    std::filesystem::path work_dir;
    if (!make_work_dir(work_root_, work_dir)) {
        return download_error("cannot create a work directory under " + work_root_.string());
    }
    ScopedRemoval cleanup(work_dir);

    TS_LOG("info", "downloading audio from " << url);
    auto proc = run_process(program_, build_args(url, work_dir), abort_, true);
    if (!proc.started) {
        return download_error(proc.error + " (is yt-dlp installed? set " + kYtDlpEnv +
                              " to override)");
    }
    if (proc.interrupted) {
        return download_error("download interrupted");
    }
    if (proc.exit_code != 0) {
        std::string msg = "yt-dlp failed with exit code " + std::to_string(proc.exit_code);
        if (!proc.stderr_tail.empty()) {
            msg += ": " + proc.stderr_tail;
        }
        return download_error(msg);
    }

    const auto wav_path = work_dir / "source.wav";
    auto decoded = read_wav_file(wav_path.string());
    if (!decoded.ok) {
        return download_error("cannot decode downloaded audio: " + decoded.message);
    }
    if (decoded.audio.frames() == 0) {
        return download_error("downloaded audio is empty");
    }

    FetchResult res;
    res.audio = std::make_shared<const PcmBuffer>(std::move(decoded.audio));
    const auto t1 = std::chrono::steady_clock::now();
    TS_LOG("info", "source ready: " << format_timestamp(res.duration()) << " ("
                                    << res.audio->format.channels << "ch "
                                    << res.audio->format.sample_rate << "Hz) in "
                                    << std::chrono::duration_cast<std::chrono::seconds>(t1 - t0)
                                           .count()
                                    << "s");
    return res;
}

}  // namespace tracksplit
