//
//  ffmpeg_encoder.cpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "ffmpeg_encoder.hpp"

#include <stdexcept>
#include <system_error>

#include "child_process.hpp"
#include "file_utils.hpp"
#include "logging.hpp"
#include "wav_codec.hpp"

namespace tracksplit {

FfmpegEncoder::FfmpegEncoder() : program_(program_from_env(kFfmpegEnv, "ffmpeg")) {}

std::vector<std::string> FfmpegEncoder::build_args(const std::filesystem::path &input,
                                                   int quality_kbps,
                                                   const std::filesystem::path &output) {
    return {"-hide_banner", "-loglevel", "error", "-nostdin", "-y",
            "-i",           input.string(),
            "-vn",          "-codec:a", "libmp3lame",
            "-b:a",         std::to_string(quality_kbps) + "k",
            "-f",           "mp3",       output.string()};
}

Status FfmpegEncoder::encode(const PcmBuffer &audio, FrameRange range, int quality_kbps,
                             const std::filesystem::path &dest) const {
    if (range.size() == 0) {
        return make_error(ErrorKind::Encode, "empty sample range for " + dest.string());
    }

    std::filesystem::path input = dest;
    input += ".input.wav";
    const auto output = partial_path(dest);
    ScopedRemoval input_cleanup(input);
    ScopedRemoval output_cleanup(output);

    std::vector<uint8_t> wav;
    try {
        wav = encode_wav(audio, range);
    } catch (const std::exception &e) {
        return make_error(ErrorKind::Encode, e.what());
    }
    Status st = write_file(input, wav);
    if (!st.ok) {
        return st;
    }
    wav.clear();
    wav.shrink_to_fit();

    // In-flight encodes are allowed to complete after an interrupt.
    auto proc = run_process(program_, build_args(input, quality_kbps, output), nullptr, false);
    if (!proc.started) {
        return make_error(ErrorKind::Encode, proc.error + " (is ffmpeg installed? set " +
                                                 kFfmpegEnv + " to override)");
    }
    if (proc.exit_code != 0) {
        std::string msg = "ffmpeg failed with exit code " + std::to_string(proc.exit_code);
        if (!proc.stderr_tail.empty()) {
            msg += ": " + proc.stderr_tail;
        }
        return make_error(ErrorKind::Encode, msg);
    }

    std::error_code ec;
    std::filesystem::rename(output, dest, ec);
    if (ec) {
        return make_error(ErrorKind::Encode,
                          "cannot rename " + output.string() + " (" + ec.message() + ")");
    }
    TS_LOG("export", "encoded " << range.size() << " frames to " << dest.string());
    return ok_status();
}

}  // namespace tracksplit
