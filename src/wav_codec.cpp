//
//  wav_codec.cpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "wav_codec.hpp"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "logging.hpp"

namespace tracksplit {

namespace {

constexpr size_t kRiffHeaderSize = 12;
constexpr size_t kChunkHeaderSize = 8;
constexpr size_t kFmtMinSize = 16;
constexpr size_t kFmtExtensibleSize = 40;
constexpr size_t kFmtSubFormatOffset = 24;
constexpr size_t kCanonicalHeaderSize = 44;
constexpr uint32_t kUnknownDataSize = 0xFFFFFFFF;

bool fourcc_is(const uint8_t *p, const char *tag) { return std::memcmp(p, tag, 4) == 0; }

void write_u16_le(std::vector<uint8_t> &buf, uint16_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void write_u32_le(std::vector<uint8_t> &buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

void write_fourcc(std::vector<uint8_t> &buf, const char *tag) {
    buf.insert(buf.end(), tag, tag + 4);
}

bool supported_layout(uint16_t tag, uint16_t bits) {
    if (tag == kWaveFormatPcm) {
        return bits == 8 || bits == 16 || bits == 24 || bits == 32;
    }
    if (tag == kWaveFormatFloat) {
        return bits == 32 || bits == 64;
    }
    return false;
}

WavDecodeResult fail(std::string msg) {
    TS_LOG("debug", "wav decode failed: " << msg);
    WavDecodeResult res;
    res.message = std::move(msg);
    return res;
}

}  // namespace

uint16_t read_u16_le(const uint8_t *p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32_le(const uint8_t *p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

WavDecodeResult decode_wav(std::vector<uint8_t> bytes) {
    if (bytes.size() < kRiffHeaderSize || !fourcc_is(bytes.data(), "RIFF") ||
        !fourcc_is(bytes.data() + 8, "WAVE")) {
        return fail("not a RIFF/WAVE file");
    }

    std::optional<PcmFormat> fmt;
    size_t data_offset = 0;
    size_t data_size = 0;
    bool have_data = false;

    size_t pos = kRiffHeaderSize;
    while (pos + kChunkHeaderSize <= bytes.size()) {
        const uint8_t *hdr = bytes.data() + pos;
        const uint32_t chunk_size = read_u32_le(hdr + 4);
        const size_t payload = pos + kChunkHeaderSize;
        const size_t available = bytes.size() - payload;

        if (fourcc_is(hdr, "fmt ")) {
            if (chunk_size < kFmtMinSize || chunk_size > available) {
                return fail("truncated fmt chunk");
            }
            const uint8_t *p = bytes.data() + payload;
            PcmFormat f;
            f.format_tag = read_u16_le(p);
            f.channels = read_u16_le(p + 2);
            f.sample_rate = read_u32_le(p + 4);
            const uint16_t block_align = read_u16_le(p + 12);
            f.bits_per_sample = read_u16_le(p + 14);
            if (f.format_tag == kWaveFormatExtensible) {
                if (chunk_size < kFmtExtensibleSize) {
                    return fail("truncated WAVE_FORMAT_EXTENSIBLE fmt chunk");
                }
                f.format_tag = read_u16_le(p + kFmtSubFormatOffset);
            }
            if (f.channels == 0 || f.sample_rate == 0) {
                return fail("fmt chunk declares zero channels or sample rate");
            }
            if (!supported_layout(f.format_tag, f.bits_per_sample)) {
                return fail("unsupported sample format tag=" + std::to_string(f.format_tag) +
                            " bits=" + std::to_string(f.bits_per_sample));
            }
            if (block_align != f.block_align()) {
                return fail("inconsistent block alignment " + std::to_string(block_align));
            }
            fmt = f;
        } else if (fourcc_is(hdr, "data")) {
            data_offset = payload;
            // Streamed writers leave the size at 0xFFFFFFFF; take what is there.
            if (chunk_size == kUnknownDataSize || chunk_size > available) {
                data_size = available;
            } else {
                data_size = chunk_size;
            }
            have_data = true;
            if (fmt) {
                break;
            }
        } else {
            TS_LOG("wav", "skipping chunk '" << std::string(reinterpret_cast<const char *>(hdr), 4)
                                             << "' size=" << chunk_size);
        }
        if (chunk_size > available) {
            break;
        }
        pos = payload + chunk_size + (chunk_size & 1u);
    }

    if (!fmt) {
        return fail("missing fmt chunk");
    }
    if (!have_data) {
        return fail("missing data chunk");
    }

    WavDecodeResult res;
    res.ok = true;
    res.audio.format = *fmt;
    const uint32_t align = fmt->block_align();
    data_size -= data_size % align;
    bytes.resize(data_offset + data_size);
    bytes.erase(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(data_offset));
    res.audio.data = std::move(bytes);
    TS_LOG("debug", "decoded wav: " << fmt->channels << "ch " << fmt->sample_rate << "Hz "
                                    << fmt->bits_per_sample << "bit frames="
                                    << res.audio.frames());
    return res;
}

WavDecodeResult read_wav_file(const std::string &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return fail("open failed for " + path + " (" + std::generic_category().message(errno) +
                    ")");
    }
    f.seekg(0, std::ios::end);
    const auto len = f.tellg();
    f.seekg(0, std::ios::beg);
    if (len < 0) {
        return fail("cannot determine size of " + path);
    }
    std::vector<uint8_t> bytes(static_cast<size_t>(len));
    f.read(reinterpret_cast<char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (f.gcount() != static_cast<std::streamsize>(bytes.size())) {
        return fail("short read for " + path);
    }
    return decode_wav(std::move(bytes));
}

std::vector<uint8_t> encode_wav(const PcmBuffer &audio, FrameRange range) {
    const uint32_t align = audio.format.block_align();
    const uint64_t end = std::min(range.end, audio.frames());
    const uint64_t begin = std::min(range.begin, end);
    const uint64_t payload = (end - begin) * align;
    if (payload > 0xFFFFFFFFull - kCanonicalHeaderSize) {
        throw std::runtime_error("wav payload too large ( > 4 GB )");
    }

    std::vector<uint8_t> out;
    out.reserve(kCanonicalHeaderSize + static_cast<size_t>(payload));
    write_fourcc(out, "RIFF");
    write_u32_le(out, static_cast<uint32_t>(payload + kCanonicalHeaderSize - 8));
    write_fourcc(out, "WAVE");
    write_fourcc(out, "fmt ");
    write_u32_le(out, static_cast<uint32_t>(kFmtMinSize));
    write_u16_le(out, audio.format.format_tag);
    write_u16_le(out, audio.format.channels);
    write_u32_le(out, audio.format.sample_rate);
    write_u32_le(out, audio.format.sample_rate * align);
    write_u16_le(out, static_cast<uint16_t>(align));
    write_u16_le(out, audio.format.bits_per_sample);
    write_fourcc(out, "data");
    write_u32_le(out, static_cast<uint32_t>(payload));
    const auto first = audio.data.begin() + static_cast<std::ptrdiff_t>(begin * align);
    out.insert(out.end(), first, first + static_cast<std::ptrdiff_t>(payload));
    return out;
}

}  // namespace tracksplit
