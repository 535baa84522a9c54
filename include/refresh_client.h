// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "state_cache.h"

#include <chrono>
#include <string>
#include <sys/types.h>

namespace wlmenu {

/**
 * @brief Foreground side of the daemon protocol
 *
 * Finds the daemon through its lock file, signals it, and watches the cache
 * generation to learn when the request was served. Never writes the cache.
 */
class RefreshClient {
  public:
    enum class Outcome {
        REFRESHED,          ///< A newer snapshot was written
        TIMED_OUT,          ///< Daemon signalled but no new snapshot in time
        DAEMON_NOT_RUNNING, ///< No lock holder
        SIGNAL_FAILED,      ///< kill() failed
        STOPPED,            ///< daemon-stop: the lock was released
    };

    RefreshClient(StateCache& cache, std::string lock_path);

    /**
     * @brief Send the immediate-refresh trigger and wait for the next generation
     */
    Outcome request_refresh(std::chrono::milliseconds timeout);

    /**
     * @brief Poll the cache until its generation exceeds @p after
     * @return true if it did before the timeout
     */
    bool wait_for_generation(uint64_t after, std::chrono::milliseconds timeout) const;

    /// SIGTERM the daemon and wait for it to release the lock
    Outcome stop_daemon(std::chrono::milliseconds timeout);

    /// PID of the running daemon, 0 if none
    pid_t daemon_pid() const;

    static const char* outcome_name(Outcome outcome);

  private:
    StateCache& cache_;
    std::string lock_path_;
};

} // namespace wlmenu
