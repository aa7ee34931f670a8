//
//  logging.cpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "logging.hpp"

#include <mutex>

namespace tracksplit {

static std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Info)};

void set_log_verbosity(LogVerbosity level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity get_log_verbosity() {
    return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

LogVerbosity parse_log_verbosity(std::string_view name) {
    if (name == "debug") return LogVerbosity::Debug;
    if (name == "info") return LogVerbosity::Info;
    if (name == "warn" || name == "warning") return LogVerbosity::Warn;
    return LogVerbosity::Error;
}

}  // namespace tracksplit

void ts_log_impl(const char* level, const std::string& msg, const char* file, int line,
                 const char* func) {
    // Export workers log concurrently; keep lines whole.
    static std::mutex log_mutex;
    std::lock_guard<std::mutex> lock(log_mutex);
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[TrackSplit][" << lvl << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[TrackSplit][" << lvl << "] " << msg << std::endl;
    }
}
