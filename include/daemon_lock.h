// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <string>
#include <sys/types.h>

namespace wlmenu {

/**
 * @brief Single-instance marker for the refresh daemon
 *
 * The lock file holds the holder's role and PID ("daemon 1234") and is held
 * with an exclusive flock() for as long as this object owns it. The kernel
 * drops the flock when the holder dies, so a file that can be locked is by
 * definition stale; if it still names a dead PID that PID is reported as
 * reclaimed.
 *
 * The same lock makes the menu's foreground refresh the single cache writer
 * while no daemon runs. Such a holder is recorded as "oneshot": it is never
 * reported as the running daemon, so clients do not signal it.
 *
 * RAII: the destructor releases (and removes) the lock file.
 */
class DaemonLock {
  public:
    enum class Status {
        ACQUIRED,        ///< We hold the lock
        ALREADY_RUNNING, ///< Another live process holds it (see holder_pid())
        IO_ERROR,        ///< Could not open/lock/write the file
    };

    enum class Role {
        DAEMON,  ///< Long-lived refresh daemon, answers SIGUSR1/SIGTERM
        ONESHOT, ///< Single foreground refresh cycle
    };

    explicit DaemonLock(std::string path, Role role = Role::DAEMON);
    ~DaemonLock();

    DaemonLock(const DaemonLock&) = delete;
    DaemonLock& operator=(const DaemonLock&) = delete;

    /**
     * @brief Try to take the lock without blocking
     */
    Status acquire();

    /**
     * @brief acquire(), waiting up to @p oneshot_wait while the holder is a
     *        one-shot writer (or has not recorded itself yet)
     *
     * A live daemon holder still returns ALREADY_RUNNING at once.
     */
    Status acquire_waiting(std::chrono::milliseconds oneshot_wait);

    /// Remove the file (if it is still ours) and drop the flock
    void release();

    bool held() const { return fd_ >= 0; }

    /// PID of the live holder after ALREADY_RUNNING, else 0
    pid_t holder_pid() const { return holder_pid_; }

    /// Role of the live holder after ALREADY_RUNNING
    Role holder_role() const { return holder_role_; }

    Role role() const { return role_; }

    /// Dead PID found in a stale lock file that acquire() replaced, else 0
    pid_t reclaimed_pid() const { return reclaimed_pid_; }

    /// Human-readable detail after IO_ERROR
    const std::string& error() const { return error_; }

    const std::string& path() const { return path_; }

    /// PID recorded in a lock file, 0 when missing or unparseable
    static pid_t read_pid(const std::string& path);

    /// Role recorded in a lock file; a bare PID (older files) counts as a daemon
    static Role read_role(const std::string& path);

    /// kill(pid, 0) liveness check; EPERM counts as alive
    static bool process_alive(pid_t pid);

    /**
     * @brief PID of the running daemon, or 0 if none
     *
     * A daemon is running when the lock file is flock()ed by a holder that
     * recorded itself as a daemon and is still alive. One-shot holders
     * report 0.
     */
    static pid_t running_daemon_pid(const std::string& path);

  private:
    std::string path_;
    Role role_;
    int fd_ = -1;
    pid_t holder_pid_ = 0;
    Role holder_role_ = Role::DAEMON;
    pid_t reclaimed_pid_ = 0;
    std::string error_;
};

const char* lock_status_name(DaemonLock::Status status);

/// Tag written into the lock file ("daemon", "oneshot")
const char* lock_role_name(DaemonLock::Role role);

} // namespace wlmenu
