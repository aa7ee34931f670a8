//
//  main.cpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "ffmpeg_encoder.hpp"
#include "logging.hpp"
#include "tracksplit.hpp"
#include "tracksplit_version.hpp"
#include "ytdlp_source.hpp"
#include <nlohmann/json.hpp>

namespace {

constexpr int kExitUsage = 1;

std::atomic<bool> g_abort{false};

extern "C" void handle_signal(int) { g_abort.store(true); }

void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    // A second interrupt falls back to the default action and ends the process.
    sa.sa_flags = SA_RESETHAND;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void print_usage(std::ostream &out) {
    out << "TrackSplit " << TRACKSPLIT_VERSION_DISPLAY << "\n"
        << "Copyright (c) 2025 Till Toenshoff\n\n"
        << "usage:\n"
        << "  tracksplit <url> <tracklist.txt> [-o DIR] [-q 128|192|256|320] [-k] [-j N]\n"
        << "             [--report FILE] [--log-level error|warn|info|debug]\n"
        << "Options:\n"
        << "  -o, --output-dir DIR   Directory for the tracks (default: output).\n"
        << "  -q, --quality KBPS     MP3 bitrate: 128, 192, 256 or 320 (default: 320).\n"
        << "  -k, --keep-original    Also write the complete source as original.mp3.\n"
        << "  -j, --jobs N           Parallel encodes (default: number of CPUs).\n"
        << "  --report FILE          Write a JSON report of every track to FILE.\n"
        << "  --log-level LEVEL      Set logging verbosity (default: info).\n"
        << "  -v, --version          Print the version and exit.\n\n"
        << "Tracklist format (one track per line, '#' starts a comment):\n"
        << "  0:00:00 - Song 1\n"
        << "  3:45 | Song 2\n"
        << "  1:07:30: Song 3\n";
}

bool write_report(const std::filesystem::path &p, const nlohmann::json &j) {
    std::ofstream out(p);
    if (!out.is_open()) return false;
    out << j.dump(2) << "\n";
    return out.good();
}

}  // namespace

int main(int argc, char **argv) {
    std::vector<std::string> positional;
    std::string output_dir = tracksplit::kDefaultOutputDir;
    std::string quality = std::to_string(tracksplit::kDefaultQualityKbps);
    std::string jobs = "0";
    std::filesystem::path report_path;
    bool keep_original = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](std::string &out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };
        if (arg == "--version" || arg == "-v") {
            std::cout << "TrackSplit " << TRACKSPLIT_VERSION_DISPLAY << "\n";
            return 0;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(std::cout);
            return 0;
        } else if (arg == "-o" || arg == "--output-dir") {
            if (!value(output_dir)) return kExitUsage;
        } else if (arg == "-q" || arg == "--quality") {
            if (!value(quality)) return kExitUsage;
        } else if (arg == "-j" || arg == "--jobs") {
            if (!value(jobs)) return kExitUsage;
        } else if (arg == "-k" || arg == "--keep-original") {
            keep_original = true;
        } else if (arg == "--report") {
            std::string p;
            if (!value(p)) return kExitUsage;
            report_path = p;
        } else if (arg == "--log-level") {
            std::string level;
            if (!value(level)) return kExitUsage;
            tracksplit::set_log_verbosity(tracksplit::parse_log_verbosity(level));
        } else if (arg == "--") {
            for (++i; i < argc; ++i) {
                positional.emplace_back(argv[i]);
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return kExitUsage;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.size() != 2) {
        print_usage(std::cerr);
        return kExitUsage;
    }
    const std::string url = positional[0];
    const std::string tracklist_path = positional[1];

    // Flag values are validated before anything touches the network.
    const auto cfg = tracksplit::make_config(output_dir, quality, keep_original, jobs);
    if (!cfg.status.ok) {
        TS_LOG("error", "tracksplit: " << cfg.status.message);
        return tracksplit::exit_code_for(cfg.status.kind);
    }
    const tracksplit::Config &config = cfg.config;

    install_signal_handlers();
    tracksplit::YtDlpAudioSource source(&g_abort);
    tracksplit::FfmpegEncoder encoder;
    auto outcome =
        tracksplit::split_tracks_from_file(url, tracklist_path, config, source, encoder, &g_abort);

    if (!outcome.report) {
        TS_LOG("error", "tracksplit: " << tracksplit::error_kind_name(outcome.status.kind) << ": "
                                       << outcome.status.message);
        return outcome.exit_code;
    }

    std::cout << "\n";
    tracksplit::print_summary(std::cout, *outcome.report);
    std::cout << "Output directory: " << std::filesystem::absolute(config.output_dir).string()
              << "\n";

    if (!report_path.empty()) {
        if (write_report(report_path, tracksplit::report_to_json(*outcome.report))) {
            std::cout << "Wrote: " << report_path.string() << "\n";
        } else {
            TS_LOG("error", "tracksplit: failed to write report " << report_path.string());
        }
    }
    return outcome.exit_code;
}
