// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "connection_orchestrator.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace wlmenu {

ConnectionOrchestrator::ConnectionOrchestrator(WifiBackend& backend, Presenter& presenter,
                                               VpnTrigger& vpn, Options options)
    : backend_(backend), presenter_(presenter), vpn_(vpn), options_(options) {
    if (options_.max_attempts < 1) {
        spdlog::warn("[Connect] max_attempts {} < 1, treating as 1", options_.max_attempts);
    }
}

const char* ConnectionOrchestrator::state_name(State state) {
    switch (state) {
    case State::IDLE:
        return "IDLE";
    case State::CONNECTING:
        return "CONNECTING";
    case State::PASSWORD_REQUIRED:
        return "PASSWORD_REQUIRED";
    case State::RETRYING:
        return "RETRYING";
    case State::CONNECTED:
        return "CONNECTED";
    case State::FAILED:
        return "FAILED";
    }
    return "UNKNOWN";
}

const char* ConnectionOrchestrator::error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NONE:
        return "NONE";
    case ErrorKind::AUTH_FAILURE:
        return "AUTH_FAILURE";
    case ErrorKind::TIMEOUT:
        return "TIMEOUT";
    case ErrorKind::ADAPTER_ERROR:
        return "ADAPTER_ERROR";
    case ErrorKind::USER_CANCELLED:
        return "USER_CANCELLED";
    }
    return "UNKNOWN";
}

std::vector<ConnectionOrchestrator::Transition> ConnectionOrchestrator::transitions() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return history_;
}

ConnectionOrchestrator::Attempt ConnectionOrchestrator::last_attempt() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return attempt_;
}

void ConnectionOrchestrator::cancel() {
    spdlog::debug("[Connect] Cancel requested in state {}", state_name(state_.load()));
    cancel_requested_ = true;
    backend_.cancel();
}

void ConnectionOrchestrator::transition(State to) {
    State from = state_.exchange(to);
    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        history_.emplace_back(from, to);
    }
    spdlog::debug("[Connect] {} -> {}", state_name(from), state_name(to));

    if (state_callback_) {
        try {
            state_callback_(from, to);
        } catch (const std::exception& e) {
            spdlog::error("[Connect] Exception in state callback: {}", e.what());
        }
    }
}

ConnectionOrchestrator::Outcome ConnectionOrchestrator::finish(State final_state, ErrorKind error,
                                                               const std::string& reason) {
    transition(final_state);

    Outcome outcome;
    outcome.final_state = final_state;
    outcome.error = error;
    outcome.reason = reason;
    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        attempt_.last_error = error;
        attempt_.finished = std::chrono::system_clock::now();
        outcome.attempts = attempt_.count;
    }
    outcome.auth_failures = auth_failures_;

    if (final_state == State::CONNECTED) {
        spdlog::info("[Connect] Connected to '{}' after {} attempt(s)", attempt_.ssid,
                     outcome.attempts);
    } else {
        spdlog::info("[Connect] '{}' failed: {} ({})", attempt_.ssid, error_kind_name(error),
                     reason);
    }
    return outcome;
}

void ConnectionOrchestrator::forget_partial_profile(const std::string& ssid) {
    // A cancel leaves the backend's cancel flag raised; the cleanup must still run
    backend_.clear_cancel();
    WiFiError result = backend_.forget(ssid);
    if (result.success()) {
        spdlog::debug("[Connect] Removed partial profile '{}'", ssid);
    } else if (result.result == WiFiResult::NETWORK_NOT_FOUND) {
        spdlog::trace("[Connect] No partial profile left for '{}'", ssid);
    } else {
        spdlog::warn("[Connect] Could not remove partial profile '{}': {}", ssid,
                     result.technical_msg);
    }
}

ConnectionOrchestrator::Outcome ConnectionOrchestrator::connect(const Request& request) {
    const int max_attempts = std::max(1, options_.max_attempts);

    state_ = State::IDLE;
    cancel_requested_ = false;
    backend_.clear_cancel();
    auth_failures_ = 0;
    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        history_.clear();
        attempt_ = Attempt();
        attempt_.ssid = request.ssid;
        attempt_.started = std::chrono::system_clock::now();
    }

    if (request.ssid.empty()) {
        return finish(State::FAILED, ErrorKind::ADAPTER_ERROR, "No network selected");
    }

    const bool secured = needs_secret(request.security);

    // Open networks: ask before any adapter call
    if (!secured && options_.warn_open_networks && !request.open_network_confirmed) {
        bool accepted = presenter_.confirm("'" + request.ssid +
                                           "' is an open network. Traffic is not encrypted. "
                                           "Connect anyway?");
        if (!accepted || cancel_requested()) {
            return finish(State::FAILED, ErrorKind::USER_CANCELLED, "Connection cancelled");
        }
    }

    std::optional<std::string> secret = request.secret;

    // Decided once: a profile that existed before this run is never ours to delete,
    // whatever secret a retry later supplies
    const bool owns_profile = !request.has_saved_profile;

    if (secured && !secret && !request.has_saved_profile) {
        transition(State::PASSWORD_REQUIRED);
        secret = presenter_.prompt_secret("Password for " + request.ssid);
        if (!secret || cancel_requested()) {
            return finish(State::FAILED, ErrorKind::USER_CANCELLED, "Connection cancelled");
        }
    }

    for (;;) {
        transition(State::CONNECTING);
        int attempt_no;
        {
            std::lock_guard<std::mutex> lock(history_mutex_);
            attempt_no = ++attempt_.count;
        }

        spdlog::info("[Connect] Attempt {}/{} for '{}'", attempt_no, max_attempts, request.ssid);
        WiFiError result = backend_.connect(request.ssid, secret, options_.connect_timeout);

        // A completed activation stands even if cancel() arrived just after it
        if (result.success()) {
            Outcome outcome = finish(State::CONNECTED, ErrorKind::NONE, "Connected");
            outcome.vpn = vpn_.activate_for(request.ssid);
            return outcome;
        }

        if (cancel_requested() || result.result == WiFiResult::CANCELLED) {
            if (owns_profile) {
                forget_partial_profile(request.ssid);
            }
            return finish(State::FAILED, ErrorKind::USER_CANCELLED, "Connection cancelled");
        }

        if (result.result == WiFiResult::AUTHENTICATION_FAILED) {
            ++auth_failures_;
            {
                std::lock_guard<std::mutex> lock(history_mutex_);
                attempt_.last_error = ErrorKind::AUTH_FAILURE;
            }
            if (owns_profile) {
                forget_partial_profile(request.ssid);
            }

            if (attempt_no >= max_attempts) {
                return finish(State::FAILED, ErrorKind::AUTH_FAILURE,
                              "Too many failed attempts for '" + request.ssid + "'");
            }

            transition(State::RETRYING);
            secret = presenter_.prompt_secret("Wrong password for " + request.ssid + " (" +
                                              std::to_string(attempt_no) + "/" +
                                              std::to_string(max_attempts) + ")");
            if (!secret || cancel_requested()) {
                return finish(State::FAILED, ErrorKind::USER_CANCELLED, "Connection cancelled");
            }
            continue;
        }

        if (owns_profile) {
            forget_partial_profile(request.ssid);
        }

        if (result.result == WiFiResult::TIMEOUT) {
            return finish(State::FAILED, ErrorKind::TIMEOUT,
                          result.user_msg.empty() ? "Connection timed out" : result.user_msg);
        }

        spdlog::warn("[Connect] Adapter error for '{}': {}", request.ssid, result.technical_msg);
        return finish(State::FAILED, ErrorKind::ADAPTER_ERROR,
                      result.user_msg.empty() ? "Connection failed" : result.user_msg);
    }
}

} // namespace wlmenu
