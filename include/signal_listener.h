// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <thread>

namespace wlmenu {

/**
 * @brief Turns process signals into ordinary callbacks on a dedicated thread
 *
 * SIGUSR1 -> on_refresh; SIGTERM, SIGINT, SIGHUP -> on_stop.
 *
 * block_signals() must run in the main thread before any other thread is
 * created so every thread inherits the blocked mask; the listener then
 * collects the signals with sigtimedwait(). Callbacks therefore run in normal
 * thread context and may lock mutexes.
 */
class SignalListener {
  public:
    using Callback = std::function<void()>;

    SignalListener(Callback on_refresh, Callback on_stop);
    ~SignalListener();

    SignalListener(const SignalListener&) = delete;
    SignalListener& operator=(const SignalListener&) = delete;

    /// Block the handled signals in the calling thread (and all threads it spawns)
    static void block_signals();

    /// The set handled by the listener
    static sigset_t handled_set();

    void start();
    void stop();

    bool running() const { return running_.load(); }

  private:
    void thread_func();

    Callback on_refresh_;
    Callback on_stop_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace wlmenu
