//
//  config.hpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <filesystem>
#include <string>

#include "status.hpp"

namespace tracksplit {

inline constexpr const char *kDefaultOutputDir = "output";
inline constexpr int kDefaultQualityKbps = 320;

/// Run settings; built once by make_config and passed by const reference afterwards.
struct Config {
    std::filesystem::path output_dir{kDefaultOutputDir};
    int quality_kbps = kDefaultQualityKbps;  ///< one of 128, 192, 256, 320
    bool keep_original = false;              ///< also write the full source as original.<ext>
    unsigned jobs = 0;                       ///< export workers, 0 = hardware concurrency
};

struct ConfigResult {
    Status status;
    Config config;
};

bool is_supported_quality(int kbps);

// Validates the textual flag values; any failure is an ErrorKind::Config status.
ConfigResult make_config(const std::string &output_dir, const std::string &quality,
                         bool keep_original, const std::string &jobs = "0");

}  // namespace tracksplit
