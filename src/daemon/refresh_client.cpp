// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "refresh_client.h"

#include "daemon_lock.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

namespace wlmenu {

namespace {
constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);
}

RefreshClient::RefreshClient(StateCache& cache, std::string lock_path)
    : cache_(cache), lock_path_(std::move(lock_path)) {}

const char* RefreshClient::outcome_name(Outcome outcome) {
    switch (outcome) {
    case Outcome::REFRESHED:
        return "REFRESHED";
    case Outcome::TIMED_OUT:
        return "TIMED_OUT";
    case Outcome::DAEMON_NOT_RUNNING:
        return "DAEMON_NOT_RUNNING";
    case Outcome::SIGNAL_FAILED:
        return "SIGNAL_FAILED";
    case Outcome::STOPPED:
        return "STOPPED";
    }
    return "UNKNOWN";
}

pid_t RefreshClient::daemon_pid() const {
    return DaemonLock::running_daemon_pid(lock_path_);
}

bool RefreshClient::wait_for_generation(uint64_t after, std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (cache_.current_generation() > after) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
}

RefreshClient::Outcome RefreshClient::request_refresh(std::chrono::milliseconds timeout) {
    pid_t pid = daemon_pid();
    if (pid <= 0) {
        spdlog::info("[RefreshClient] Daemon not running (no holder of {})", lock_path_);
        return Outcome::DAEMON_NOT_RUNNING;
    }

    uint64_t before = cache_.current_generation();
    if (kill(pid, SIGUSR1) != 0) {
        int err = errno;
        spdlog::error("[RefreshClient] Cannot signal daemon PID {}: {}", pid, strerror(err));
        return err == ESRCH ? Outcome::DAEMON_NOT_RUNNING : Outcome::SIGNAL_FAILED;
    }
    spdlog::debug("[RefreshClient] Sent refresh to PID {}, waiting past generation {}", pid,
                  before);

    if (wait_for_generation(before, timeout)) {
        return Outcome::REFRESHED;
    }
    spdlog::warn("[RefreshClient] No new snapshot within {}ms", timeout.count());
    return Outcome::TIMED_OUT;
}

RefreshClient::Outcome RefreshClient::stop_daemon(std::chrono::milliseconds timeout) {
    pid_t pid = daemon_pid();
    if (pid <= 0) {
        return Outcome::DAEMON_NOT_RUNNING;
    }

    if (kill(pid, SIGTERM) != 0) {
        int err = errno;
        spdlog::error("[RefreshClient] Cannot stop daemon PID {}: {}", pid, strerror(err));
        return err == ESRCH ? Outcome::DAEMON_NOT_RUNNING : Outcome::SIGNAL_FAILED;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (daemon_pid() == 0) {
            spdlog::info("[RefreshClient] Daemon PID {} stopped", pid);
            return Outcome::STOPPED;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
    return Outcome::TIMED_OUT;
}

} // namespace wlmenu
