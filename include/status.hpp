//
//  status.hpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace tracksplit {

/// Failure categories; each maps to one process exit code (see exit_code_for).
enum class ErrorKind {
    None,
    Parse,     ///< malformed tracklist line or timestamp
    Order,     ///< non-monotonic or duplicate offsets
    Range,     ///< timestamp at or beyond the source duration
    Download,  ///< source could not be fetched or decoded
    Encode,    ///< one segment could not be encoded or written
    Config,    ///< invalid command line value
};

/**
 * @brief Result object with success flag, failure category and message.
 *
 * When `ok == true`, `kind` is `ErrorKind::None` and `message` is empty.
 */
struct Status {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    std::string message;
};

inline Status ok_status() { return Status{}; }

inline Status make_error(ErrorKind kind, std::string msg) {
    return Status{false, kind, std::move(msg)};
}

const char *error_kind_name(ErrorKind kind);

// Process exit code for a run that stopped with the given error (0 for None).
int exit_code_for(ErrorKind kind);

}  // namespace tracksplit
