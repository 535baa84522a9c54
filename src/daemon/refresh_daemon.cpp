// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "refresh_daemon.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <ctime>

namespace wlmenu {

RefreshDaemon::RefreshDaemon(WifiBackend& backend, StateCache& cache,
                             std::chrono::seconds interval)
    : backend_(backend), cache_(cache), interval_(interval),
      wall_clock_([]() { return static_cast<int64_t>(std::time(nullptr)); }) {}

RefreshDaemon::~RefreshDaemon() {
    // Use fprintf - spdlog may be destroyed during static cleanup
    fprintf(stderr, "[RefreshDaemon] Destroyed after %llu cycles\n",
            static_cast<unsigned long long>(cycles_run_.load()));
}

void RefreshDaemon::request_refresh() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        refresh_pending_ = true;
    }
    cv_.notify_all();
}

void RefreshDaemon::request_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    backend_.cancel();
    cv_.notify_all();
}

bool RefreshDaemon::stopping() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_requested_;
}

RefreshDaemon::Clock::time_point RefreshDaemon::next_deadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_deadline_;
}

bool RefreshDaemon::run_cycle() {
    ++cycles_run_;

    std::vector<NetworkRecord> networks;
    WiFiError result = backend_.scan(networks);
    if (!result.success()) {
        ++cycles_failed_;
        if (result.result == WiFiResult::CANCELLED) {
            spdlog::debug("[RefreshDaemon] Scan cancelled");
        } else {
            spdlog::warn("[RefreshDaemon] Scan failed, keeping previous snapshot: {}",
                         result.technical_msg);
        }
        return false;
    }

    auto snap = cache_.publish(std::move(networks), wall_clock_());
    if (!snap) {
        ++cycles_failed_;
        spdlog::warn("[RefreshDaemon] Could not write snapshot to {}", cache_.path());
        return false;
    }

    spdlog::info("[RefreshDaemon] Generation {}: {} networks", snap->generation,
                 snap->networks.size());
    return true;
}

uint64_t RefreshDaemon::run() {
    spdlog::info("[RefreshDaemon] Started (interval {}s, cache {})", interval_.count(),
                 cache_.path());

    uint64_t start_count = cycles_run_.load();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        next_deadline_ = Clock::now() + interval_;
        // Requests made before run() are satisfied by the initial cycle
        refresh_pending_ = false;
    }

    if (!stopping()) {
        run_cycle();
    }

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        bool woke = cv_.wait_until(lock, next_deadline_,
                                   [this]() { return stop_requested_ || refresh_pending_; });
        if (stop_requested_) {
            break;
        }

        bool forced = woke && refresh_pending_;
        if (forced) {
            // Consumed before the cycle: requests arriving during it trigger one more
            refresh_pending_ = false;
        } else {
            // Timer fired; skip deadlines missed while suspended or scanning
            auto now = Clock::now();
            while (next_deadline_ <= now) {
                next_deadline_ += interval_;
            }
        }

        // Re-armed under the lock so a concurrent request_stop() cancel is not lost
        backend_.clear_cancel();
        lock.unlock();
        if (forced) {
            ++forced_cycles_;
            spdlog::debug("[RefreshDaemon] Immediate refresh requested");
        } else {
            ++timer_cycles_;
        }
        run_cycle();
        lock.lock();
    }

    uint64_t cycles = cycles_run_.load() - start_count;
    spdlog::info("[RefreshDaemon] Stopped after {} cycles", cycles);
    return cycles;
}

} // namespace wlmenu
