// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "signal_listener.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <pthread.h>

namespace wlmenu {

namespace {
constexpr long WAIT_SLICE_NS = 200L * 1000 * 1000;
}

SignalListener::SignalListener(Callback on_refresh, Callback on_stop)
    : on_refresh_(std::move(on_refresh)), on_stop_(std::move(on_stop)) {}

SignalListener::~SignalListener() {
    stop();
}

sigset_t SignalListener::handled_set() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGUSR1);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGHUP);
    return set;
}

void SignalListener::block_signals() {
    sigset_t set = handled_set();
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        spdlog::error("[Signals] pthread_sigmask failed: {}", strerror(rc));
    }
}

void SignalListener::start() {
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread(&SignalListener::thread_func, this);
}

void SignalListener::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void SignalListener::thread_func() {
    sigset_t set = handled_set();
    struct timespec slice = {0, WAIT_SLICE_NS};

    spdlog::debug("[Signals] Listener started");
    while (running_) {
        int sig = sigtimedwait(&set, nullptr, &slice);
        if (sig < 0) {
            if (errno != EAGAIN && errno != EINTR) {
                spdlog::error("[Signals] sigtimedwait failed: {}", strerror(errno));
            }
            continue;
        }

        try {
            if (sig == SIGUSR1) {
                spdlog::debug("[Signals] SIGUSR1: refresh requested");
                if (on_refresh_) {
                    on_refresh_();
                }
            } else {
                spdlog::info("[Signals] {} received, shutting down", strsignal(sig));
                if (on_stop_) {
                    on_stop_();
                }
            }
        } catch (const std::exception& e) {
            spdlog::error("[Signals] Exception in signal callback: {}", e.what());
        }
    }
    spdlog::debug("[Signals] Listener stopped");
}

} // namespace wlmenu
