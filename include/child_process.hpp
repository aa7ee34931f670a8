//
//  child_process.hpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <string>
#include <vector>

namespace tracksplit {

struct ProcessResult {
    bool started{false};      ///< false when the program could not be spawned
    bool interrupted{false};  ///< terminated because the abort flag was raised
    int exit_code = -1;       ///< exit status, or -1 when killed by a signal
    std::string error;        ///< spawn failure reason
    std::string stderr_tail;  ///< last few KB the child wrote to stderr
};

/**
 * @brief Run `program` (looked up in PATH) with `args`, without a shell.
 *
 * stdin is /dev/null, stdout is inherited, stderr is captured. The child runs in its own
 * process group so a terminal interrupt only reaches us. When `terminate_on_abort` is set and
 * `abort` becomes true, the child and everything in its process group are sent SIGTERM;
 * otherwise the child is allowed to finish.
 */
ProcessResult run_process(const std::string &program, const std::vector<std::string> &args,
                          const std::atomic<bool> *abort = nullptr,
                          bool terminate_on_abort = true);

// Program name from the environment variable `env_name`, or `fallback`.
std::string program_from_env(const char *env_name, const std::string &fallback);

}  // namespace tracksplit
