// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "presenter.h"
#include "vpn_trigger.h"
#include "wifi_backend.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wlmenu {

/**
 * @brief Drives one connect request to a terminal state
 *
 * Handles password prompting, bounded retry on credential errors, removal of
 * the partial profile a failed attempt leaves behind, the open-network
 * confirmation, and the VPN hand-off after success.
 *
 * State Machine:
 * ```
 * IDLE -> CONNECTING ----------------------------> CONNECTED
 *  |  \        ^   \
 *  |   \       |    +--(auth failure, n < K)--> RETRYING --+
 *  |    \      +------------------------------------------+
 *  |     +-> PASSWORD_REQUIRED --(secret)--> CONNECTING
 *  |
 *  +--(open network declined)--> FAILED
 *
 * CONNECTING --(auth failure, n == K | timeout | adapter error | cancel)--> FAILED
 * ```
 *
 * Retries are consumed only by credential errors. Timeouts and other adapter
 * errors fail immediately. A profile is forgotten after a failed attempt only
 * when no saved profile existed before connect() began; a pre-existing one is
 * kept even if a retry with a new password also fails. Once the adapter
 * reports success the outcome is CONNECTED, even if cancel() races with it.
 *
 * Thread Safety:
 * - connect() runs on one thread at a time
 * - cancel() and state() may be called from any thread
 */
class ConnectionOrchestrator {
  public:
    enum class State {
        IDLE,              ///< No request in progress
        CONNECTING,        ///< Adapter connect call in flight
        PASSWORD_REQUIRED, ///< Waiting for the first secret
        RETRYING,          ///< Credential rejected, waiting for a new secret
        CONNECTED,         ///< Terminal: success
        FAILED             ///< Terminal: see ErrorKind
    };

    enum class ErrorKind { NONE, AUTH_FAILURE, TIMEOUT, ADAPTER_ERROR, USER_CANCELLED };

    struct Options {
        int max_attempts = 3;
        std::chrono::seconds connect_timeout{15};
        bool warn_open_networks = true;
    };

    struct Request {
        std::string ssid;
        SecurityKind security = SecurityKind::UNKNOWN;
        bool has_saved_profile = false;
        std::optional<std::string> secret;
        bool open_network_confirmed = false; ///< Skip the open-network question
    };

    /// Transient record of the current/last run
    struct Attempt {
        std::string ssid;
        int count = 0;
        ErrorKind last_error = ErrorKind::NONE;
        std::chrono::system_clock::time_point started;
        std::chrono::system_clock::time_point finished;
    };

    struct Outcome {
        State final_state = State::FAILED;
        ErrorKind error = ErrorKind::NONE;
        std::string reason; ///< User-facing, never raw toolkit output
        int attempts = 0;
        int auth_failures = 0;
        std::optional<VpnActivation> vpn;

        bool connected() const { return final_state == State::CONNECTED; }
    };

    using Transition = std::pair<State, State>;
    using StateCallback = std::function<void(State from, State to)>;

    ConnectionOrchestrator(WifiBackend& backend, Presenter& presenter, VpnTrigger& vpn,
                           Options options);

    /**
     * @brief Run a connect request to completion
     */
    Outcome connect(const Request& request);

    /// Abort the running request; it ends in FAILED/USER_CANCELLED
    void cancel();

    State state() const { return state_.load(); }

    /// Transitions of the last run, in order
    std::vector<Transition> transitions() const;

    /// Record of the last run
    Attempt last_attempt() const;

    void set_state_callback(StateCallback callback) { state_callback_ = std::move(callback); }

    const Options& options() const { return options_; }

    static const char* state_name(State state);
    static const char* error_kind_name(ErrorKind kind);

  private:
    void transition(State to);
    Outcome finish(State final_state, ErrorKind error, const std::string& reason);
    void forget_partial_profile(const std::string& ssid);
    bool cancel_requested() const { return cancel_requested_.load(); }

    WifiBackend& backend_;
    Presenter& presenter_;
    VpnTrigger& vpn_;
    const Options options_;
    StateCallback state_callback_;

    std::atomic<State> state_{State::IDLE};
    std::atomic<bool> cancel_requested_{false};

    mutable std::mutex history_mutex_;
    std::vector<Transition> history_;
    Attempt attempt_;
    int auth_failures_ = 0;
};

} // namespace wlmenu
