// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "wifi_backend.h"

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace wlmenu {

/**
 * @brief Mock network with the password the simulated AP expects
 *
 * Real backends don't store passwords - they're only needed for mock
 * authentication simulation.
 */
struct MockWiFiNetwork {
    NetworkRecord record;  ///< ssid, security, signal
    std::string password;  ///< Expected password (empty for open networks)

    MockWiFiNetwork(const std::string& ssid, int strength, SecurityKind security,
                    const std::string& pass = "")
        : password(pass) {
        record.ssid = ssid;
        record.signal_strength = strength;
        record.security = security;
    }
};

/**
 * @brief In-memory backend for --test mode and unit tests
 *
 * Behaves like NetworkManager where it matters to callers:
 * - connect() with a secret creates a saved profile even when activation fails
 * - connect() without a secret activates a saved profile, or joins an open network
 * - forget() deletes the profile
 *
 * Tests can script connect results, inject scan failures, add delays (which
 * honor cancel()), and inspect every call made.
 */
class WifiBackendMock : public WifiBackend {
  public:
    struct ConnectCall {
        std::string ssid;
        bool had_secret;
    };

    WifiBackendMock();
    ~WifiBackendMock() override;

    // ========================================================================
    // WifiBackend Interface Implementation
    // ========================================================================

    WiFiError start() override;
    void stop() override;
    bool is_running() const override;

    WiFiError scan(std::vector<NetworkRecord>& networks) override;
    WiFiError connect(const std::string& ssid, const std::optional<std::string>& secret,
                      std::chrono::seconds timeout) override;
    WiFiError disconnect(const std::string& ssid) override;
    WiFiError forget(const std::string& ssid) override;
    WiFiError saved_profiles(std::vector<std::string>& names) override;
    WiFiError active_ssid(std::string& ssid) override;
    WiFiError connection_details(const std::string& ssid, ConnectionDetails& details) override;
    WiFiError saved_secret(const std::string& ssid, std::string& secret) override;

    WiFiError start_vpn(const std::string& profile) override;
    WiFiError set_access_point(bool on, const std::string& ssid,
                               const std::string& passphrase) override;
    WiFiError access_point_status(bool& active, std::string& profile) override;
    WiFiError radio_enabled(bool& enabled) override;
    WiFiError set_radio(bool enabled) override;
    std::optional<double> ping(const std::string& host, int count) override;

    void cancel() override;
    void clear_cancel() override;

    // ========================================================================
    // Scenario setup
    // ========================================================================

    /// Realistic variety of networks for --test runs
    void populate_demo_networks();

    void add_network(const MockWiFiNetwork& network);
    void clear_networks();

    /// Pretend a profile (with its secret) already exists in NetworkManager
    void add_saved_profile(const std::string& name, const std::string& secret = "");

    /// Results returned by the next connect() calls, in order, before simulation applies
    void script_connect_results(const std::vector<WiFiResult>& results);

    void set_scan_failure(bool fail);
    void set_scan_delay(std::chrono::milliseconds delay);
    void set_connect_delay(std::chrono::milliseconds delay);
    void set_vpn_result(const WiFiError& result);
    void set_access_point_result(const WiFiError& result);
    void set_ping_latency(std::optional<double> latency_ms);
    void set_signal_jitter(bool enabled);

    // ========================================================================
    // Inspection
    // ========================================================================

    std::vector<ConnectCall> connect_calls() const;
    std::vector<std::string> vpn_calls() const;
    std::vector<std::string> forget_calls() const;
    std::set<std::string> saved_profile_set() const;
    std::string connected_ssid() const;
    int scan_count() const { return scan_count_.load(); }
    int access_point_calls() const;

  private:
    /// Sleep in small steps; false when cancel() interrupted the wait
    bool simulated_delay(std::chrono::milliseconds delay);
    void vary_signal_strengths();
    MockWiFiNetwork* find_network(const std::string& ssid);

    mutable std::mutex mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> cancel_requested_{false};
    std::atomic<int> scan_count_{0};

    std::vector<MockWiFiNetwork> networks_;
    std::map<std::string, std::string> saved_profiles_; ///< name -> secret
    std::string connected_ssid_;
    bool radio_on_ = true;
    bool ap_active_ = false;
    std::string ap_ssid_;
    int ap_calls_ = 0;

    std::deque<WiFiResult> scripted_results_;
    bool scan_failure_ = false;
    bool signal_jitter_ = false;
    std::chrono::milliseconds scan_delay_{0};
    std::chrono::milliseconds connect_delay_{0};
    WiFiError vpn_result_;
    WiFiError ap_result_;
    std::optional<double> ping_latency_{12.5};

    std::vector<ConnectCall> connect_log_;
    std::vector<std::string> vpn_log_;
    std::vector<std::string> forget_log_;

    std::mt19937 rng_;
};

} // namespace wlmenu
