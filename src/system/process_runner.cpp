// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "process_runner.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace wlmenu {

namespace {

constexpr int POLL_INTERVAL_MS = 50;

/// Build "KEY=VALUE" strings for execve, before fork (no allocation in the child)
std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        if (overrides.count(key) == 0) {
            env.push_back(std::move(entry));
        }
    }
    for (const auto& kv : overrides) {
        env.push_back(kv.first + "=" + kv.second);
    }
    return env;
}

std::vector<char*> to_c_array(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(&s[0]);
    }
    out.push_back(nullptr);
    return out;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/// Drain whatever is readable on fd into buf; closes fd on EOF
void drain(int& fd, std::string& buf) {
    char chunk[4096];
    for (;;) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            buf.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            close_fd(fd);
        } else if (errno == EINTR) {
            continue;
        }
        return;
    }
}

} // namespace

std::string ProcessResult::last_error_line() const {
    std::istringstream stream(err);
    std::string line;
    std::string last;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            last = line;
        }
    }
    return last;
}

ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options) {
    ProcessResult result;
    if (argv.empty()) {
        result.spawn_failed = true;
        return result;
    }

    std::vector<std::string> args = argv;
    std::vector<char*> c_args = to_c_array(args);
    std::vector<std::string> env = build_environment(options.env);
    std::vector<char*> c_env = to_c_array(env);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
        pipe2(in_pipe, O_CLOEXEC) != 0) {
        spdlog::error("[Process] pipe failed: {}", strerror(errno));
        for (int* p : {out_pipe, err_pipe, in_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        result.spawn_failed = true;
        return result;
    }

    spdlog::trace("[Process] exec: {} ({} args)", argv[0], argv.size() - 1);

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("[Process] fork failed: {}", strerror(errno));
        for (int* p : {out_pipe, err_pipe, in_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        result.spawn_failed = true;
        return result;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        signal(SIGPIPE, SIG_DFL);
        signal(SIGUSR1, SIG_DFL);

        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        execvpe(c_args[0], c_args.data(), c_env.data());
        _exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    if (!options.stdin_data.empty()) {
        // Small payloads only (secrets); a blocking write is fine below PIPE_BUF
        const char* data = options.stdin_data.data();
        size_t left = options.stdin_data.size();
        while (left > 0) {
            ssize_t n = write(in_pipe[1], data, left);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                spdlog::debug("[Process] stdin write failed: {}", strerror(errno));
                break;
            }
            data += n;
            left -= static_cast<size_t>(n);
        }
    }
    close_fd(in_pipe[1]);

    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    auto start_time = std::chrono::steady_clock::now();
    int status = 0;
    bool child_done = false;

    auto terminate_child = [&]() {
        kill(pid, SIGTERM);
        auto grace_end = std::chrono::steady_clock::now() + options.kill_grace;
        while (std::chrono::steady_clock::now() < grace_end) {
            if (waitpid(pid, &status, WNOHANG) == pid) {
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    };

    while (!child_done) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_pipe[0] >= 0) {
            fds[nfds++] = {out_pipe[0], POLLIN, 0};
        }
        if (err_pipe[0] >= 0) {
            fds[nfds++] = {err_pipe[0], POLLIN, 0};
        }
        if (nfds > 0) {
            poll(fds, nfds, POLL_INTERVAL_MS);
            if (out_pipe[0] >= 0) {
                drain(out_pipe[0], result.out);
            }
            if (err_pipe[0] >= 0) {
                drain(err_pipe[0], result.err);
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
        }

        if (options.cancel_flag && options.cancel_flag->load()) {
            spdlog::debug("[Process] {} cancelled", argv[0]);
            result.cancelled = true;
            terminate_child();
            break;
        }

        pid_t wait_result = waitpid(pid, &status, WNOHANG);
        if (wait_result == pid) {
            child_done = true;
        } else if (wait_result < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("[Process] waitpid error: {}", strerror(errno));
            result.spawn_failed = true;
            break;
        } else if (std::chrono::steady_clock::now() - start_time > options.timeout) {
            spdlog::debug("[Process] {} timed out after {}ms", argv[0], options.timeout.count());
            result.timed_out = true;
            terminate_child();
            break;
        }
    }

    // Collect trailing output written just before exit
    if (out_pipe[0] >= 0) {
        drain(out_pipe[0], result.out);
    }
    if (err_pipe[0] >= 0) {
        drain(err_pipe[0], result.err);
    }
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    if (child_done) {
        result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        if (result.exit_code == 127 && result.out.empty()) {
            result.spawn_failed = true;
        }
    }

    spdlog::trace("[Process] {} exited with code {}", argv[0], result.exit_code);
    return result;
}

bool find_in_path(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0;
    }
    const char* path = std::getenv("PATH");
    if (!path) {
        return false;
    }
    std::istringstream stream(path);
    std::string dir;
    while (std::getline(stream, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        std::string candidate = dir + "/" + name;
        struct stat st;
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace wlmenu
