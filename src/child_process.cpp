//
//  child_process.cpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "child_process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "logging.hpp"

extern char **environ;

namespace tracksplit {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr size_t kStderrTailBytes = 4096;

void append_tail(std::string &tail, const char *data, size_t len) {
    tail.append(data, len);
    if (tail.size() > kStderrTailBytes) {
        tail.erase(0, tail.size() - kStderrTailBytes);
    }
}

std::string describe_command(const std::string &program, const std::vector<std::string> &args) {
    std::string out = program;
    for (const auto &a : args) {
        out += ' ';
        out += a;
    }
    return out;
}

/// Owns the spawn attribute/file-action objects for one posix_spawnp call.
class SpawnSetup {
public:
    SpawnSetup() {
        posix_spawn_file_actions_init(&actions_);
        posix_spawnattr_init(&attr_);
    }
    ~SpawnSetup() {
        posix_spawn_file_actions_destroy(&actions_);
        posix_spawnattr_destroy(&attr_);
    }
    SpawnSetup(const SpawnSetup &) = delete;
    SpawnSetup &operator=(const SpawnSetup &) = delete;

    posix_spawn_file_actions_t *actions() { return &actions_; }
    posix_spawnattr_t *attr() { return &attr_; }

private:
    posix_spawn_file_actions_t actions_;
    posix_spawnattr_t attr_;
};

}  // namespace

std::string program_from_env(const char *env_name, const std::string &fallback) {
    const char *value = std::getenv(env_name);
    if (value != nullptr && *value != '\0') {
        return value;
    }
    return fallback;
}

ProcessResult run_process(const std::string &program, const std::vector<std::string> &args,
                          const std::atomic<bool> *abort, bool terminate_on_abort) {
    ProcessResult res;
    TS_LOG("process", "exec: " << describe_command(program, args));

    int err_pipe[2];
    if (pipe(err_pipe) != 0) {
        res.error = std::string("pipe failed: ") + std::strerror(errno);
        return res;
    }
    // Keep the pipe out of children spawned concurrently by other workers.
    fcntl(err_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(err_pipe[1], F_SETFD, FD_CLOEXEC);

    SpawnSetup setup;
    posix_spawn_file_actions_addopen(setup.actions(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(setup.actions(), err_pipe[1], STDERR_FILENO);
    posix_spawn_file_actions_addclose(setup.actions(), err_pipe[0]);
    posix_spawn_file_actions_addclose(setup.actions(), err_pipe[1]);
    posix_spawnattr_setflags(setup.attr(), POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(setup.attr(), 0);

    std::vector<char *> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char *>(program.c_str()));
    for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = 0;
    const int rc =
        posix_spawnp(&pid, program.c_str(), setup.actions(), setup.attr(), argv.data(), environ);
    close(err_pipe[1]);
    if (rc != 0) {
        close(err_pipe[0]);
        res.error = "cannot run " + program + ": " + std::strerror(rc);
        TS_LOG("debug", res.error);
        return res;
    }
    res.started = true;
    fcntl(err_pipe[0], F_SETFL, fcntl(err_pipe[0], F_GETFL) | O_NONBLOCK);

    bool pipe_open = true;
    bool signalled = false;
    int status = 0;
    char buf[512];
    for (;;) {
        if (abort != nullptr && terminate_on_abort && !signalled && abort->load()) {
            // The child leads its own process group; helpers it started go down with it.
            TS_LOG("debug", "terminating process group " << pid);
            kill(-pid, SIGTERM);
            signalled = true;
            res.interrupted = true;
        }
        if (pipe_open) {
            pollfd pfd{err_pipe[0], POLLIN, 0};
            const int pr = poll(&pfd, 1, kPollIntervalMs);
            if (pr > 0) {
                const ssize_t n = read(err_pipe[0], buf, sizeof(buf));
                if (n > 0) {
                    append_tail(res.stderr_tail, buf, static_cast<size_t>(n));
                    continue;
                }
                if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                    pipe_open = false;
                }
            }
        } else {
            usleep(kPollIntervalMs * 1000);
        }
        const pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            break;
        }
        if (w < 0 && errno != EINTR) {
            res.error = std::string("waitpid failed: ") + std::strerror(errno);
            break;
        }
    }
    // Drain whatever is left after exit.
    if (pipe_open) {
        ssize_t n = 0;
        while ((n = read(err_pipe[0], buf, sizeof(buf))) > 0) {
            append_tail(res.stderr_tail, buf, static_cast<size_t>(n));
        }
    }
    close(err_pipe[0]);

    if (res.error.empty() && WIFEXITED(status)) {
        res.exit_code = WEXITSTATUS(status);
    }
    TS_LOG("process", program << " finished exit_code=" << res.exit_code
                              << " interrupted=" << res.interrupted);
    return res;
}

}  // namespace tracksplit
