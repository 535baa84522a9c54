// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "state_cache.h"
#include "wifi_backend.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>

namespace wlmenu {

/**
 * @brief Periodic scan loop that keeps the StateCache warm
 *
 * run() performs a cycle immediately, then one per interval. request_refresh()
 * wakes it for an extra cycle without moving the interval deadline. Any number
 * of requests that arrive while waiting, or while a cycle is running, collapse
 * into exactly one extra cycle; none is lost.
 *
 * A failed scan leaves the cache untouched and is retried at the next deadline.
 *
 * Thread safety: request_refresh() and request_stop() may be called from any
 * thread. run() must only be called from one thread.
 */
class RefreshDaemon {
  public:
    using Clock = std::chrono::steady_clock;
    using WallClock = std::function<int64_t()>;

    RefreshDaemon(WifiBackend& backend, StateCache& cache, std::chrono::seconds interval);
    ~RefreshDaemon();

    RefreshDaemon(const RefreshDaemon&) = delete;
    RefreshDaemon& operator=(const RefreshDaemon&) = delete;

    /// Block until request_stop(); returns the number of cycles performed
    uint64_t run();

    /// Ask for one immediate cycle (coalesced)
    void request_refresh();

    /// Stop the loop and cancel the in-flight backend call
    void request_stop();

    /**
     * @brief Perform one scan/publish cycle on the calling thread
     * @return true if a new snapshot was written
     */
    bool run_cycle();

    /// Source of Unix time for scan timestamps (tests pin it)
    void set_wall_clock(WallClock clock) { wall_clock_ = std::move(clock); }

    uint64_t cycles_run() const { return cycles_run_.load(); }
    uint64_t cycles_failed() const { return cycles_failed_.load(); }
    uint64_t forced_cycles() const { return forced_cycles_.load(); }
    uint64_t timer_cycles() const { return timer_cycles_.load(); }
    bool stopping() const;

    /// Steady-clock time of the next periodic cycle
    Clock::time_point next_deadline() const;

  private:
    WifiBackend& backend_;
    StateCache& cache_;
    const std::chrono::seconds interval_;
    WallClock wall_clock_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    bool refresh_pending_ = false;
    Clock::time_point next_deadline_;

    std::atomic<uint64_t> cycles_run_{0};
    std::atomic<uint64_t> cycles_failed_{0};
    std::atomic<uint64_t> forced_cycles_{0};
    std::atomic<uint64_t> timer_cycles_{0};
};

} // namespace wlmenu
