//
//  file_utils.cpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "file_utils.hpp"

#include <fstream>
#include <system_error>

#include "logging.hpp"

namespace tracksplit {

Status ensure_dir(const std::filesystem::path &dir) {
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        return ok_status();
    }
    std::filesystem::create_directories(dir, ec);
    if (ec || !std::filesystem::is_directory(dir, ec)) {
        std::string msg = "cannot create directory " + dir.string() + " (" +
                          (ec ? ec.message() : std::string("not a directory")) + ")";
        TS_LOG("error", msg);
        return make_error(ErrorKind::Encode, msg);
    }
    TS_LOG("debug", "created directory " << dir.string());
    return ok_status();
}

std::filesystem::path partial_path(const std::filesystem::path &path) {
    std::filesystem::path p = path;
    p += ".part";
    return p;
}

Status write_file(const std::filesystem::path &path, const std::vector<uint8_t> &data) {
    const auto tmp = partial_path(path);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return make_error(ErrorKind::Encode, "cannot open " + tmp.string() + " for writing");
        }
        out.write(reinterpret_cast<const char *>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        out.close();
        if (!out) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            return make_error(ErrorKind::Encode, "write failed for " + tmp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return make_error(ErrorKind::Encode,
                          "cannot rename " + tmp.string() + " to " + path.string() + " (" +
                              ec.message() + ")");
    }
    return ok_status();
}

ScopedRemoval::~ScopedRemoval() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        TS_LOG("warn", "could not remove " << path_.string() << ": " << ec.message());
    }
}

}  // namespace tracksplit
