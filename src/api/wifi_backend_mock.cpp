// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_backend_mock.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <thread>

namespace wlmenu {

WifiBackendMock::WifiBackendMock()
    : rng_(static_cast<std::mt19937::result_type>(
          std::chrono::steady_clock::now().time_since_epoch().count())) {
    spdlog::debug("[WifiBackend] Mock backend initialized");
}

WifiBackendMock::~WifiBackendMock() {
    stop();
    // Use fprintf - spdlog may be destroyed during static cleanup
    fprintf(stderr, "[WifiBackend] Mock backend destroyed\n");
}

// ============================================================================
// Lifecycle Management
// ============================================================================

WiFiError WifiBackendMock::start() {
    if (running_) {
        return WiFiErrorHelper::success();
    }
    running_ = true;
    spdlog::info("[WifiBackend] Mock backend started (simulator mode)");
    return WiFiErrorHelper::success();
}

void WifiBackendMock::stop() {
    running_ = false;
}

bool WifiBackendMock::is_running() const {
    return running_;
}

void WifiBackendMock::cancel() {
    cancel_requested_ = true;
}

void WifiBackendMock::clear_cancel() {
    cancel_requested_ = false;
}

bool WifiBackendMock::simulated_delay(std::chrono::milliseconds delay) {
    auto end = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < end) {
        if (cancel_requested_) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return !cancel_requested_;
}

// ============================================================================
// Scenario setup
// ============================================================================

void WifiBackendMock::populate_demo_networks() {
    std::lock_guard<std::mutex> lock(mutex_);
    networks_ = {
        MockWiFiNetwork("HomeNet", 88, SecurityKind::WPA2, "12345678"),
        MockWiFiNetwork("Office-Main", 74, SecurityKind::ENTERPRISE),
        MockWiFiNetwork("CoffeeShop_Free", 63, SecurityKind::OPEN),
        MockWiFiNetwork("IoT-Devices", 52, SecurityKind::WPA, "12345678"),
        MockWiFiNetwork("Neighbor-Network", 38, SecurityKind::WPA3, "12345678"),
        MockWiFiNetwork("Legacy-Router", 21, SecurityKind::WEP, "abcde"),
    };
    saved_profiles_["HomeNet"] = "12345678";
    signal_jitter_ = true;
    spdlog::debug("[WifiBackend] Mock: Initialized {} mock networks", networks_.size());
}

void WifiBackendMock::add_network(const MockWiFiNetwork& network) {
    std::lock_guard<std::mutex> lock(mutex_);
    networks_.push_back(network);
}

void WifiBackendMock::clear_networks() {
    std::lock_guard<std::mutex> lock(mutex_);
    networks_.clear();
}

void WifiBackendMock::add_saved_profile(const std::string& name, const std::string& secret) {
    std::lock_guard<std::mutex> lock(mutex_);
    saved_profiles_[name] = secret;
}

void WifiBackendMock::script_connect_results(const std::vector<WiFiResult>& results) {
    std::lock_guard<std::mutex> lock(mutex_);
    scripted_results_.assign(results.begin(), results.end());
}

void WifiBackendMock::set_scan_failure(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    scan_failure_ = fail;
}

void WifiBackendMock::set_scan_delay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    scan_delay_ = delay;
}

void WifiBackendMock::set_connect_delay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    connect_delay_ = delay;
}

void WifiBackendMock::set_vpn_result(const WiFiError& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    vpn_result_ = result;
}

void WifiBackendMock::set_access_point_result(const WiFiError& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    ap_result_ = result;
}

void WifiBackendMock::set_ping_latency(std::optional<double> latency_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    ping_latency_ = latency_ms;
}

void WifiBackendMock::set_signal_jitter(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    signal_jitter_ = enabled;
}

// ============================================================================
// Inspection
// ============================================================================

std::vector<WifiBackendMock::ConnectCall> WifiBackendMock::connect_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connect_log_;
}

std::vector<std::string> WifiBackendMock::vpn_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return vpn_log_;
}

std::vector<std::string> WifiBackendMock::forget_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return forget_log_;
}

std::set<std::string> WifiBackendMock::saved_profile_set() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> names;
    for (const auto& kv : saved_profiles_) {
        names.insert(kv.first);
    }
    return names;
}

std::string WifiBackendMock::connected_ssid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_ssid_;
}

int WifiBackendMock::access_point_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ap_calls_;
}

// ============================================================================
// Networks
// ============================================================================

MockWiFiNetwork* WifiBackendMock::find_network(const std::string& ssid) {
    for (auto& net : networks_) {
        if (net.record.ssid == ssid) {
            return &net;
        }
    }
    return nullptr;
}

void WifiBackendMock::vary_signal_strengths() {
    for (auto& net : networks_) {
        int variation = static_cast<int>(rng_() % 11) - 5; // -5 to +5
        net.record.signal_strength = std::max(0, std::min(100, net.record.signal_strength + variation));
    }
}

WiFiError WifiBackendMock::scan(std::vector<NetworkRecord>& networks) {
    if (!running_) {
        return WiFiErrorHelper::not_initialized();
    }

    std::chrono::milliseconds delay;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        delay = scan_delay_;
    }
    if (!simulated_delay(delay)) {
        return WiFiErrorHelper::cancelled("Scan");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ++scan_count_;

    if (scan_failure_) {
        spdlog::debug("[WifiBackend] Mock: Simulated scan failure");
        return WiFiErrorHelper::backend_error("Mock scan failure", "Scan failed");
    }
    if (!radio_on_) {
        return WiFiErrorHelper::rf_kill_blocked();
    }

    if (signal_jitter_) {
        vary_signal_strengths();
    }

    std::vector<NetworkRecord> out;
    out.reserve(networks_.size());
    for (const auto& net : networks_) {
        NetworkRecord rec = net.record;
        rec.saved = saved_profiles_.count(rec.ssid) > 0;
        rec.in_use = rec.ssid == connected_ssid_;
        out.push_back(rec);
    }
    spdlog::debug("[WifiBackend] Mock: Scan returned {} networks", out.size());
    networks = std::move(out);
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendMock::connect(const std::string& ssid, const std::optional<std::string>& secret,
                                   std::chrono::seconds timeout) {
    if (!running_) {
        return WiFiErrorHelper::not_initialized();
    }

    std::chrono::milliseconds delay;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_log_.push_back({ssid, secret.has_value()});
        // NetworkManager persists the profile before activation completes
        if (secret) {
            saved_profiles_[ssid] = *secret;
        }
        delay = connect_delay_;
    }

    if (!simulated_delay(delay)) {
        spdlog::debug("[WifiBackend] Mock: Connect to '{}' cancelled", ssid);
        return WiFiErrorHelper::cancelled("Connection to " + ssid);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!scripted_results_.empty()) {
        WiFiResult scripted = scripted_results_.front();
        scripted_results_.pop_front();
        switch (scripted) {
        case WiFiResult::SUCCESS:
            connected_ssid_ = ssid;
            return WiFiErrorHelper::success();
        case WiFiResult::AUTHENTICATION_FAILED:
            return WiFiErrorHelper::authentication_failed(ssid);
        case WiFiResult::TIMEOUT:
            return WiFiErrorHelper::timeout("Connection to " + ssid, timeout);
        case WiFiResult::NETWORK_NOT_FOUND:
            return WiFiErrorHelper::network_not_found(ssid);
        case WiFiResult::CANCELLED:
            return WiFiErrorHelper::cancelled("Connection to " + ssid);
        default:
            return WiFiError(scripted, "Scripted mock failure", "Connection failed");
        }
    }

    MockWiFiNetwork* net = find_network(ssid);
    if (!net) {
        return WiFiErrorHelper::network_not_found(ssid);
    }

    if (secret) {
        if (*secret != net->password) {
            return WiFiErrorHelper::authentication_failed(ssid);
        }
    } else if (needs_secret(net->record.security)) {
        auto it = saved_profiles_.find(ssid);
        if (it == saved_profiles_.end() || it->second != net->password) {
            return WiFiErrorHelper::authentication_failed(ssid);
        }
    } else {
        saved_profiles_.emplace(ssid, "");
    }

    connected_ssid_ = ssid;
    spdlog::info("[WifiBackend] Mock: Connected to '{}'", ssid);
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendMock::disconnect(const std::string& ssid) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connected_ssid_.empty() || (!ssid.empty() && ssid != connected_ssid_)) {
        return WiFiErrorHelper::backend_error("Not connected to " + ssid, "Not connected");
    }
    connected_ssid_.clear();
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendMock::forget(const std::string& ssid) {
    std::lock_guard<std::mutex> lock(mutex_);
    forget_log_.push_back(ssid);
    if (saved_profiles_.erase(ssid) == 0) {
        return WiFiErrorHelper::network_not_found(ssid);
    }
    if (connected_ssid_ == ssid) {
        connected_ssid_.clear();
    }
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendMock::saved_profiles(std::vector<std::string>& names) {
    std::lock_guard<std::mutex> lock(mutex_);
    names.clear();
    for (const auto& kv : saved_profiles_) {
        names.push_back(kv.first);
    }
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendMock::active_ssid(std::string& ssid) {
    std::lock_guard<std::mutex> lock(mutex_);
    ssid = connected_ssid_;
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendMock::connection_details(const std::string& ssid, ConnectionDetails& details) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ssid != connected_ssid_) {
        return WiFiErrorHelper::backend_error("Not connected to " + ssid, "Not connected");
    }
    details = ConnectionDetails();
    details.ssid = ssid;
    details.ip_address = "192.168.1.150";
    details.gateway = "192.168.1.1";
    details.dns = {"192.168.1.1"};
    if (MockWiFiNetwork* net = find_network(ssid)) {
        details.security = net->record.security;
        details.signal_strength = net->record.signal_strength;
    }
    details.latency_ms = ping_latency_;
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendMock::saved_secret(const std::string& ssid, std::string& secret) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = saved_profiles_.find(ssid);
    if (it == saved_profiles_.end()) {
        return WiFiErrorHelper::network_not_found(ssid);
    }
    secret = it->second;
    return WiFiErrorHelper::success();
}

// ============================================================================
// VPN / Access point / Radio
// ============================================================================

WiFiError WifiBackendMock::start_vpn(const std::string& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    vpn_log_.push_back(profile);
    return vpn_result_;
}

WiFiError WifiBackendMock::set_access_point(bool on, const std::string& ssid,
                                            const std::string& /*passphrase*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++ap_calls_;
    if (!ap_result_.success()) {
        return ap_result_;
    }
    if (on && ssid.empty() && ap_ssid_.empty()) {
        return WiFiErrorHelper::network_not_found("Hotspot");
    }
    ap_active_ = on;
    if (on && !ssid.empty()) {
        ap_ssid_ = ssid;
    }
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendMock::access_point_status(bool& active, std::string& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    active = ap_active_;
    profile = ap_active_ ? "Hotspot" : "";
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendMock::radio_enabled(bool& enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled = radio_on_;
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendMock::set_radio(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    radio_on_ = enabled;
    if (!enabled) {
        connected_ssid_.clear();
    }
    return WiFiErrorHelper::success();
}

std::optional<double> WifiBackendMock::ping(const std::string& /*host*/, int /*count*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connected_ssid_.empty()) {
        return std::nullopt;
    }
    return ping_latency_;
}

} // namespace wlmenu
