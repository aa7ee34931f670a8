//
//  config.cpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "config.hpp"

#include <charconv>

#include "logging.hpp"

namespace tracksplit {

namespace {

constexpr int kSupportedQualities[] = {128, 192, 256, 320};
constexpr unsigned kMaxJobs = 256;

bool parse_unsigned(const std::string &text, unsigned &out) {
    if (text.empty()) {
        return false;
    }
    const char *b = text.data();
    const char *e = b + text.size();
    auto r = std::from_chars(b, e, out);
    return r.ec == std::errc() && r.ptr == e;
}

}  // namespace

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "ok";
        case ErrorKind::Parse:
            return "parse error";
        case ErrorKind::Order:
            return "order error";
        case ErrorKind::Range:
            return "range error";
        case ErrorKind::Download:
            return "download error";
        case ErrorKind::Encode:
            return "encode error";
        case ErrorKind::Config:
            return "configuration error";
    }
    return "error";
}

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return 0;
        case ErrorKind::Parse:
        case ErrorKind::Order:
        case ErrorKind::Range:
        case ErrorKind::Config:
            return 1;
        case ErrorKind::Download:
            return 2;
        case ErrorKind::Encode:
            return 4;
    }
    return 1;
}

bool is_supported_quality(int kbps) {
    for (int q : kSupportedQualities) {
        if (q == kbps) {
            return true;
        }
    }
    return false;
}

ConfigResult make_config(const std::string &output_dir, const std::string &quality,
                         bool keep_original, const std::string &jobs) {
    ConfigResult res;
    if (output_dir.empty()) {
        res.status = make_error(ErrorKind::Config, "output directory must not be empty");
        return res;
    }
    unsigned kbps = 0;
    if (!parse_unsigned(quality, kbps) || !is_supported_quality(static_cast<int>(kbps))) {
        res.status = make_error(ErrorKind::Config, "invalid quality '" + quality +
                                                       "' (expected 128, 192, 256 or 320)");
        return res;
    }
    unsigned job_count = 0;
    if (!parse_unsigned(jobs, job_count) || job_count > kMaxJobs) {
        res.status = make_error(ErrorKind::Config, "invalid job count '" + jobs + "'");
        return res;
    }
    res.config.output_dir = output_dir;
    res.config.quality_kbps = static_cast<int>(kbps);
    res.config.keep_original = keep_original;
    res.config.jobs = job_count;
    TS_LOG("debug", "config output_dir=" << output_dir << " quality=" << kbps
                                         << "k keep_original=" << keep_original
                                         << " jobs=" << job_count);
    return res;
}

}  // namespace tracksplit
