// Shared helpers for the unit tests: temp directories, synthetic PCM buffers and
// in-process fakes for the audio source and encoder.
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include "audio_source.hpp"
#include "file_utils.hpp"
#include "pcm_buffer.hpp"

namespace test_utils {

inline bool check(const char *suite, bool cond, const std::string &msg) {
    if (!cond) {
        std::fprintf(stderr, "[%s] FAIL: %s\n", suite, msg.c_str());
    }
    return cond;
}

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string &tag) {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("tracksplit-test-" + tag + "-" + std::to_string(getpid()) + "-" +
                 std::to_string(counter.fetch_add(1)));
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }

private:
    std::filesystem::path path_;
};

/// 16-bit PCM buffer whose samples encode their frame index (low 16 bits).
inline tracksplit::PcmBuffer make_pcm(uint32_t sample_rate, uint16_t channels, uint64_t frames) {
    tracksplit::PcmBuffer buf;
    buf.format.format_tag = tracksplit::kWaveFormatPcm;
    buf.format.sample_rate = sample_rate;
    buf.format.channels = channels;
    buf.format.bits_per_sample = 16;
    buf.data.reserve(static_cast<size_t>(frames * buf.format.block_align()));
    for (uint64_t f = 0; f < frames; ++f) {
        for (uint16_t c = 0; c < channels; ++c) {
            buf.data.push_back(static_cast<uint8_t>(f & 0xFF));
            buf.data.push_back(static_cast<uint8_t>((f >> 8) & 0xFF));
        }
    }
    return buf;
}

inline size_t count_files(const std::filesystem::path &dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return 0;
    }
    size_t n = 0;
    for (const auto &e : std::filesystem::directory_iterator(dir)) {
        if (e.is_regular_file()) {
            ++n;
        }
    }
    return n;
}

/// Source that hands out a prepared buffer and counts how often it was asked.
class FakeSource : public tracksplit::AudioSource {
public:
    explicit FakeSource(tracksplit::PcmBuffer audio)
        : audio_(std::make_shared<const tracksplit::PcmBuffer>(std::move(audio))) {}

    tracksplit::FetchResult fetch_and_decode(const std::string &url) override {
        ++calls;
        last_url = url;
        tracksplit::FetchResult res;
        if (!fail_with.empty()) {
            res.status = tracksplit::make_error(tracksplit::ErrorKind::Download, fail_with);
            return res;
        }
        res.audio = audio_;
        return res;
    }

    int calls = 0;
    std::string last_url;
    std::string fail_with;

private:
    std::shared_ptr<const tracksplit::PcmBuffer> audio_;
};

/// Encoder that writes the raw slice bytes and records every request.
class FakeEncoder : public tracksplit::Encoder {
public:
    struct Call {
        tracksplit::FrameRange range;
        int quality_kbps = 0;
        std::filesystem::path dest;
    };

    std::string extension() const override { return "mp3"; }

    tracksplit::Status encode(const tracksplit::PcmBuffer &audio, tracksplit::FrameRange range,
                              int quality_kbps,
                              const std::filesystem::path &dest) const override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(Call{range, quality_kbps, dest});
        }
        if (hook) {
            hook(dest);
        }
        if (fail_if && fail_if(dest)) {
            return tracksplit::make_error(tracksplit::ErrorKind::Encode,
                                          "simulated failure for " + dest.filename().string());
        }
        std::vector<uint8_t> bytes(audio.data.begin() +
                                       static_cast<std::ptrdiff_t>(range.begin *
                                                                   audio.format.block_align()),
                                   audio.data.begin() +
                                       static_cast<std::ptrdiff_t>(range.end *
                                                                   audio.format.block_align()));
        return tracksplit::write_file(dest, bytes);
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    // Returning true makes the encode for that destination fail.
    std::function<bool(const std::filesystem::path &)> fail_if;
    // Runs before every encode (e.g. to sleep or raise an abort flag).
    std::function<void(const std::filesystem::path &)> hook;

private:
    mutable std::mutex mutex_;
    mutable std::vector<Call> calls_;
};

}  // namespace test_utils
