//
//  file_utils.hpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "status.hpp"

namespace tracksplit {

// Create `dir` and its parents; succeeds when it already exists as a directory.
Status ensure_dir(const std::filesystem::path &dir);

// Write `data` to `<path>.part`, then rename over `path`. On failure nothing is left behind.
Status write_file(const std::filesystem::path &path, const std::vector<uint8_t> &data);

// `<path>.part`, the name used while a file is being produced.
std::filesystem::path partial_path(const std::filesystem::path &path);

/// Removes a file or directory tree on scope exit unless released.
class ScopedRemoval {
public:
    explicit ScopedRemoval(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScopedRemoval();

    ScopedRemoval(const ScopedRemoval &) = delete;
    ScopedRemoval &operator=(const ScopedRemoval &) = delete;

    void release() { path_.clear(); }

private:
    std::filesystem::path path_;
};

}  // namespace tracksplit
