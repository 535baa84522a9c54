// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace wlmenu {

/**
 * @brief Outcome of one child process run
 */
struct ProcessResult {
    int exit_code = -1;        ///< Exit status, -1 when killed or not started
    bool timed_out = false;    ///< Killed because the deadline passed
    bool cancelled = false;    ///< Killed because the cancel flag was raised
    bool spawn_failed = false; ///< fork() failed or the binary could not be executed
    std::string out;           ///< Captured stdout
    std::string err;           ///< Captured stderr

    bool ok() const { return !timed_out && !cancelled && !spawn_failed && exit_code == 0; }

    /// Last non-empty line of stderr (nmcli puts the reason there)
    std::string last_error_line() const;
};

struct ProcessOptions {
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};

    /// Polled while waiting; raising it terminates the child
    const std::atomic<bool>* cancel_flag = nullptr;

    /// Written to the child's stdin, which is then closed
    std::string stdin_data;

    /// Added to (or replacing entries in) the inherited environment
    std::map<std::string, std::string> env;

    /// Grace period between SIGTERM and SIGKILL
    std::chrono::milliseconds kill_grace{500};
};

/**
 * @brief Run argv[0] from PATH without a shell and collect its output
 *
 * No shell is involved, so SSIDs and secrets can be passed as plain arguments.
 * The child gets a cleared signal mask and default SIGPIPE disposition. On
 * timeout or cancellation it receives SIGTERM, then SIGKILL after the grace
 * period, and is always reaped before this returns.
 *
 * Exit code 127 with an empty stdout is reported as spawn_failed.
 */
ProcessResult run_process(const std::vector<std::string>& argv,
                          const ProcessOptions& options = ProcessOptions());

/// True when @p name resolves to an executable in PATH
bool find_in_path(const std::string& name);

} // namespace wlmenu
