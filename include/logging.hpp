//
//  logging.hpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace tracksplit {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Maps a --log-level argument to a verbosity; unknown names fall back to Error.
LogVerbosity parse_log_verbosity(std::string_view name);

}  // namespace tracksplit

inline constexpr tracksplit::LogVerbosity ts_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return tracksplit::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return tracksplit::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return tracksplit::LogVerbosity::Info;
    }
    // Everything else (process/wav/export/etc.) treated as debug-level.
    return tracksplit::LogVerbosity::Debug;
}

inline bool ts_should_log(const char* level) {
    const auto current = tracksplit::get_log_verbosity();
    const auto sev = ts_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

void ts_log_impl(const char* level, const std::string& msg, const char* file, int line,
                 const char* func);

#define TS_LOG(level, message)                                              \
    do {                                                                    \
        if (ts_should_log(level)) {                                         \
            std::ostringstream _ts_log_ss;                                  \
            _ts_log_ss << message;                                          \
            ts_log_impl(level, _ts_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
