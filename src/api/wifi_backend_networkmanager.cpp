// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_backend_networkmanager.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace wlmenu {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return "";
    }
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Extra slack on top of nmcli's own --wait so nmcli reports the timeout itself
constexpr auto CONNECT_GRACE = std::chrono::seconds(5);

} // namespace

WifiBackendNetworkManager::WifiBackendNetworkManager() {
    spdlog::debug("[WifiBackend] NM backend created");
}

WifiBackendNetworkManager::~WifiBackendNetworkManager() {
    stop();
    // Use fprintf - spdlog may be destroyed during static cleanup
    fprintf(stderr, "[WifiBackend] NM backend destroyed\n");
}

// ============================================================================
// Lifecycle
// ============================================================================

WiFiError WifiBackendNetworkManager::start() {
    if (running_) {
        return WiFiErrorHelper::success();
    }

    WiFiError prereq = check_system_prerequisites();
    if (!prereq.success()) {
        return prereq;
    }

    wifi_interface_ = detect_wifi_interface();
    if (wifi_interface_.empty()) {
        return WiFiErrorHelper::hardware_not_available();
    }

    running_ = true;
    spdlog::info("[WifiBackend] NM: Started on interface {}", wifi_interface_);
    return WiFiErrorHelper::success();
}

void WifiBackendNetworkManager::stop() {
    if (!running_) {
        return;
    }
    cancel();
    running_ = false;
}

bool WifiBackendNetworkManager::is_running() const {
    return running_;
}

void WifiBackendNetworkManager::cancel() {
    cancel_requested_ = true;
}

void WifiBackendNetworkManager::clear_cancel() {
    cancel_requested_ = false;
}

// ============================================================================
// System Prerequisites
// ============================================================================

ProcessResult WifiBackendNetworkManager::exec_nmcli(const std::vector<std::string>& args,
                                                    std::chrono::milliseconds timeout) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back("nmcli");
    argv.insert(argv.end(), args.begin(), args.end());

    ProcessOptions opts;
    opts.timeout = timeout;
    opts.cancel_flag = &cancel_requested_;
    opts.env["LC_ALL"] = "C";

    ProcessResult res = run_process(argv, opts);
    if (!res.ok()) {
        spdlog::trace("[WifiBackend] NM: nmcli {} -> exit {} ({})", args.empty() ? "" : args[0],
                      res.exit_code, res.last_error_line());
    }
    return res;
}

WiFiError WifiBackendNetworkManager::command_error(const std::string& what,
                                                   const ProcessResult& res) const {
    if (res.cancelled) {
        return WiFiErrorHelper::cancelled(what);
    }
    if (res.timed_out) {
        return WiFiError(WiFiResult::TIMEOUT, what + " timed out", "Operation timed out");
    }
    if (res.spawn_failed) {
        return WiFiErrorHelper::service_not_running("nmcli");
    }
    std::string detail = res.last_error_line();
    if (res.exit_code == NMCLI_EXIT_NOT_FOUND) {
        return WiFiError(WiFiResult::NETWORK_NOT_FOUND, what + ": " + detail,
                         detail.empty() ? "Not found" : detail);
    }
    if (to_lower(detail).find("not authorized") != std::string::npos) {
        return WiFiErrorHelper::permission_denied(what + ": " + detail);
    }
    return WiFiErrorHelper::backend_error(what + " failed (exit " + std::to_string(res.exit_code) +
                                              "): " + detail,
                                          detail.empty() ? what + " failed" : detail);
}

WiFiError WifiBackendNetworkManager::check_system_prerequisites() {
    spdlog::debug("[WifiBackend] NM: Checking prerequisites");

    if (!find_in_path("nmcli")) {
        return WiFiErrorHelper::service_not_running("NetworkManager (nmcli not installed)");
    }

    // nmcli -t general status: connected:full:enabled:enabled:enabled:enabled
    ProcessResult res = exec_nmcli({"-t", "general", "status"});
    if (!res.ok() || trim(res.out).empty()) {
        return WiFiErrorHelper::service_not_running("NetworkManager (" + res.last_error_line() +
                                                    ")");
    }
    return WiFiErrorHelper::success();
}

std::string WifiBackendNetworkManager::detect_wifi_interface() {
    // Output: wlan0:wifi
    ProcessResult res = exec_nmcli({"-t", "-f", "DEVICE,TYPE", "device", "status"});
    if (!res.ok()) {
        return "";
    }

    std::istringstream stream(res.out);
    std::string line;
    while (std::getline(stream, line)) {
        auto fields = split_nmcli_fields(line);
        if (fields.size() >= 2 && fields[1] == "wifi") {
            const std::string& iface = fields[0];
            bool valid = !iface.empty();
            for (char c : iface) {
                if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
                    valid = false;
                    break;
                }
            }
            if (!valid) {
                spdlog::warn("[WifiBackend] NM: Suspicious interface name '{}', skipping", iface);
                continue;
            }
            spdlog::debug("[WifiBackend] NM: Detected Wi-Fi interface: {}", iface);
            return iface;
        }
    }

    spdlog::debug("[WifiBackend] NM: No Wi-Fi interface found in NM device list");
    return "";
}

std::vector<std::string> WifiBackendNetworkManager::ifname_args() const {
    if (wifi_interface_.empty()) {
        return {};
    }
    return {"ifname", wifi_interface_};
}

// ============================================================================
// Scanning
// ============================================================================

WiFiError WifiBackendNetworkManager::scan(std::vector<NetworkRecord>& networks) {
    if (!running_) {
        return WiFiErrorHelper::not_initialized();
    }

    std::vector<std::string> args = {"-t", "-f", "IN-USE,SSID,SIGNAL,SECURITY", "device", "wifi",
                                      "list", "--rescan", "yes"};
    auto ifn = ifname_args();
    args.insert(args.end(), ifn.begin(), ifn.end());

    ProcessResult res = exec_nmcli(args, std::chrono::seconds(30));
    if (!res.ok()) {
        if (res.exit_code >= 0 && !res.cancelled && !res.timed_out) {
            bool enabled = true;
            if (radio_enabled(enabled).success() && !enabled) {
                return WiFiErrorHelper::rf_kill_blocked();
            }
        }
        return command_error("scan", res);
    }

    std::vector<NetworkRecord> parsed = parse_scan_output(res.out);

    std::vector<std::string> saved;
    WiFiError saved_result = saved_profiles(saved);
    if (!saved_result.success()) {
        spdlog::debug("[WifiBackend] NM: Saved profile lookup failed: {}",
                      saved_result.technical_msg);
    }
    for (auto& rec : parsed) {
        rec.saved = std::find(saved.begin(), saved.end(), rec.ssid) != saved.end();
    }

    spdlog::debug("[WifiBackend] NM: Scan complete, {} entries", parsed.size());
    networks = std::move(parsed);
    return WiFiErrorHelper::success();
}

// ============================================================================
// Parsing
// ============================================================================

std::vector<std::string> WifiBackendNetworkManager::split_nmcli_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;

    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '\\' && i + 1 < line.size()) {
            char next = line[i + 1];
            if (next == ':' || next == '\\') {
                current += next;
                ++i;
            } else {
                current += line[i];
            }
        } else if (line[i] == ':') {
            fields.push_back(current);
            current.clear();
        } else {
            current += line[i];
        }
    }

    fields.push_back(current);
    return fields;
}

std::vector<NetworkRecord> WifiBackendNetworkManager::parse_scan_output(const std::string& output) {
    std::vector<NetworkRecord> networks;
    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        // IN-USE:SSID:SIGNAL:SECURITY, IN-USE is " " or "*"
        auto fields = split_nmcli_fields(line);
        if (fields.size() < 4) {
            spdlog::trace("[WifiBackend] NM: Skipping malformed scan line ({} fields)",
                          fields.size());
            continue;
        }

        NetworkRecord rec;
        rec.in_use = trim(fields[0]) == "*";
        rec.ssid = fields[1];
        if (rec.ssid.empty()) {
            continue;
        }

        try {
            rec.signal_strength = std::stoi(fields[2]);
        } catch (const std::exception&) {
            spdlog::trace("[WifiBackend] NM: Invalid signal '{}' for SSID '{}'", fields[2],
                          rec.ssid);
            continue;
        }
        rec.signal_strength = std::max(0, std::min(100, rec.signal_strength));
        rec.security = parse_security(trim(fields[3]));
        networks.push_back(std::move(rec));
    }

    return networks;
}

std::vector<std::string> WifiBackendNetworkManager::parse_wifi_profiles(const std::string& output) {
    std::vector<std::string> names;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        auto fields = split_nmcli_fields(line);
        if (fields.size() >= 2 && fields[1] == "802-11-wireless" && !fields[0].empty()) {
            names.push_back(fields[0]);
        }
    }
    return names;
}

void WifiBackendNetworkManager::parse_ip4_details(const std::string& output,
                                                  ConnectionDetails& details) {
    // IP4.ADDRESS[1]:192.168.1.20/24
    // IP4.GATEWAY:192.168.1.1
    // IP4.DNS[1]:192.168.1.1
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = line.substr(0, colon);
        std::string value = trim(line.substr(colon + 1));
        if (value.empty() || value == "--") {
            continue;
        }
        if (key.rfind("IP4.ADDRESS", 0) == 0 && details.ip_address.empty()) {
            details.ip_address = value.substr(0, value.find('/'));
        } else if (key == "IP4.GATEWAY") {
            details.gateway = value;
        } else if (key.rfind("IP4.DNS", 0) == 0) {
            details.dns.push_back(value);
        }
    }
}

std::optional<double> WifiBackendNetworkManager::parse_ping_output(const std::string& output) {
    // rtt min/avg/max/mdev = 9.812/10.200/10.588/0.388 ms   (iputils)
    // round-trip min/avg/max = 9.812/10.200/10.588 ms       (busybox)
    auto eq = output.find(" = ");
    if (eq == std::string::npos) {
        return std::nullopt;
    }
    std::string stats = output.substr(eq + 3);
    auto first = stats.find('/');
    if (first == std::string::npos) {
        return std::nullopt;
    }
    auto second = stats.find('/', first + 1);
    if (second == std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stod(stats.substr(first + 1, second - first - 1));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Input Validation
// ============================================================================

std::string WifiBackendNetworkManager::validate_input(const std::string& input,
                                                      const std::string& field_name) {
    if (input.empty()) {
        spdlog::error("[WifiBackend] NM: Empty {}", field_name);
        return "";
    }

    if (input.length() > 255) {
        spdlog::error("[WifiBackend] NM: {} too long ({} chars)", field_name, input.length());
        return "";
    }

    for (char ch : input) {
        unsigned char c = static_cast<unsigned char>(ch);
        // Reject control chars (0x00-0x1F) and DEL (0x7F)
        if (c < 32 || c == 127) {
            spdlog::error("[WifiBackend] NM: Invalid character in {}: ASCII {}", field_name,
                          static_cast<int>(c));
            return "";
        }
    }

    return input;
}

// ============================================================================
// Connection Management
// ============================================================================

WiFiError WifiBackendNetworkManager::classify_connect_failure(const std::string& ssid,
                                                              const ProcessResult& res,
                                                              std::chrono::seconds timeout) {
    if (res.cancelled) {
        return WiFiErrorHelper::cancelled("Connection to " + ssid);
    }
    if (res.spawn_failed) {
        return WiFiErrorHelper::service_not_running("nmcli");
    }

    std::string last = res.last_error_line();
    std::string lower = to_lower(res.err);

    if (lower.find("secrets") != std::string::npos ||
        lower.find("password") != std::string::npos ||
        lower.find("authentication") != std::string::npos ||
        lower.find("802-11-wireless-security") != std::string::npos) {
        WiFiError err = WiFiErrorHelper::authentication_failed(ssid);
        err.technical_msg += " (" + last + ")";
        return err;
    }
    if (res.timed_out || res.exit_code == NMCLI_EXIT_TIMEOUT ||
        lower.find("timeout") != std::string::npos ||
        lower.find("timed out") != std::string::npos) {
        return WiFiErrorHelper::timeout("Connection to " + ssid, timeout);
    }
    if (res.exit_code == NMCLI_EXIT_NOT_FOUND ||
        lower.find("no network with ssid") != std::string::npos) {
        return WiFiErrorHelper::network_not_found(ssid);
    }
    return WiFiErrorHelper::connection_failed(last.empty()
                                                  ? "nmcli exited with code " +
                                                        std::to_string(res.exit_code)
                                                  : last);
}

WiFiError WifiBackendNetworkManager::connect(const std::string& ssid,
                                             const std::optional<std::string>& secret,
                                             std::chrono::seconds timeout) {
    if (!running_) {
        return WiFiErrorHelper::not_initialized();
    }

    std::string clean_ssid = validate_input(ssid, "SSID");
    if (clean_ssid.empty()) {
        return WiFiError(WiFiResult::INVALID_PARAMETERS,
                         "SSID contains invalid characters or is empty", "Invalid network name",
                         "Check that the network name is correct");
    }
    if (secret && validate_input(*secret, "password").empty()) {
        return WiFiErrorHelper::authentication_failed(ssid + " (password contains invalid characters)");
    }

    std::vector<std::string> args = {"--wait", std::to_string(timeout.count())};
    if (secret) {
        spdlog::info("[WifiBackend] NM: Connecting to '{}' with a new secret", clean_ssid);
        args.insert(args.end(), {"device", "wifi", "connect", clean_ssid, "password", *secret});
        auto ifn = ifname_args();
        args.insert(args.end(), ifn.begin(), ifn.end());
    } else {
        std::vector<std::string> saved;
        WiFiError saved_result = saved_profiles(saved);
        if (!saved_result.success()) {
            return saved_result;
        }
        if (std::find(saved.begin(), saved.end(), clean_ssid) != saved.end()) {
            spdlog::info("[WifiBackend] NM: Activating saved profile '{}'", clean_ssid);
            args.insert(args.end(), {"connection", "up", "id", clean_ssid});
        } else {
            spdlog::info("[WifiBackend] NM: Connecting to '{}'", clean_ssid);
            args.insert(args.end(), {"device", "wifi", "connect", clean_ssid});
            auto ifn = ifname_args();
            args.insert(args.end(), ifn.begin(), ifn.end());
        }
    }

    ProcessResult res = exec_nmcli(args, timeout + CONNECT_GRACE);
    if (res.ok()) {
        spdlog::info("[WifiBackend] NM: Connected to '{}'", clean_ssid);
        return WiFiErrorHelper::success();
    }

    WiFiError err = classify_connect_failure(clean_ssid, res, timeout);
    spdlog::warn("[WifiBackend] NM: Connection to '{}' failed: {} ({})", clean_ssid,
                 wifi_result_name(err.result), err.technical_msg);
    return err;
}

WiFiError WifiBackendNetworkManager::disconnect(const std::string& ssid) {
    if (!running_) {
        return WiFiErrorHelper::not_initialized();
    }

    spdlog::info("[WifiBackend] NM: Disconnecting from '{}'", ssid);
    ProcessResult res;
    if (ssid.empty()) {
        std::vector<std::string> args = {"device", "disconnect"};
        args.push_back(wifi_interface_);
        res = exec_nmcli(args);
    } else {
        res = exec_nmcli({"connection", "down", "id", ssid});
    }
    if (!res.ok()) {
        return command_error("disconnect", res);
    }
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendNetworkManager::forget(const std::string& ssid) {
    if (!running_) {
        return WiFiErrorHelper::not_initialized();
    }

    spdlog::info("[WifiBackend] NM: Deleting profile '{}'", ssid);
    ProcessResult res = exec_nmcli({"connection", "delete", "id", ssid});
    if (!res.ok()) {
        if (res.exit_code == NMCLI_EXIT_NOT_FOUND) {
            return WiFiErrorHelper::network_not_found(ssid);
        }
        return command_error("forget", res);
    }
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendNetworkManager::saved_profiles(std::vector<std::string>& names) {
    ProcessResult res = exec_nmcli({"-t", "-f", "NAME,TYPE", "connection", "show"});
    if (!res.ok()) {
        return command_error("list profiles", res);
    }
    names = parse_wifi_profiles(res.out);
    return WiFiErrorHelper::success();
}

// ============================================================================
// Status
// ============================================================================

WiFiError WifiBackendNetworkManager::active_ssid(std::string& ssid) {
    if (!running_) {
        return WiFiErrorHelper::not_initialized();
    }

    ProcessResult res = exec_nmcli(
        {"-t", "-f", "IN-USE,SSID,SIGNAL,SECURITY", "device", "wifi", "list", "--rescan", "no"});
    if (!res.ok()) {
        return command_error("status", res);
    }
    ssid.clear();
    for (const auto& rec : parse_scan_output(res.out)) {
        if (rec.in_use) {
            ssid = rec.ssid;
            break;
        }
    }
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendNetworkManager::connection_details(const std::string& ssid,
                                                        ConnectionDetails& details) {
    if (!running_) {
        return WiFiErrorHelper::not_initialized();
    }

    details = ConnectionDetails();
    details.ssid = ssid;

    ProcessResult ip = exec_nmcli(
        {"-t", "-f", "IP4.ADDRESS,IP4.GATEWAY,IP4.DNS", "device", "show", wifi_interface_});
    if (!ip.ok()) {
        return command_error("device details", ip);
    }
    parse_ip4_details(ip.out, details);

    ProcessResult list = exec_nmcli(
        {"-t", "-f", "IN-USE,SSID,SIGNAL,SECURITY", "device", "wifi", "list", "--rescan", "no"});
    if (list.ok()) {
        for (const auto& rec : parse_scan_output(list.out)) {
            if (rec.in_use && rec.ssid == ssid) {
                details.signal_strength = rec.signal_strength;
                details.security = rec.security;
                break;
            }
        }
    }
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendNetworkManager::saved_secret(const std::string& ssid, std::string& secret) {
    ProcessResult res = exec_nmcli(
        {"-s", "-g", "802-11-wireless-security.psk", "connection", "show", "id", ssid});
    if (!res.ok()) {
        if (res.exit_code == NMCLI_EXIT_NOT_FOUND) {
            return WiFiErrorHelper::network_not_found(ssid);
        }
        return command_error("read secret", res);
    }
    secret = trim(res.out);
    return WiFiErrorHelper::success();
}

std::optional<double> WifiBackendNetworkManager::ping(const std::string& host, int count) {
    ProcessOptions opts;
    opts.timeout = std::chrono::seconds(count * 2 + 3);
    opts.cancel_flag = &cancel_requested_;
    opts.env["LC_ALL"] = "C";
    ProcessResult res =
        run_process({"ping", "-c", std::to_string(count), "-W", "2", "-q", host}, opts);
    if (!res.ok()) {
        spdlog::debug("[WifiBackend] ping {} failed (exit {})", host, res.exit_code);
        return std::nullopt;
    }
    return parse_ping_output(res.out);
}

// ============================================================================
// VPN / Access point / Radio
// ============================================================================

WiFiError WifiBackendNetworkManager::start_vpn(const std::string& profile) {
    spdlog::info("[WifiBackend] NM: Bringing up VPN '{}'", profile);
    ProcessResult res = exec_nmcli({"connection", "up", "id", profile}, std::chrono::seconds(60));
    if (!res.ok()) {
        return command_error("VPN " + profile, res);
    }
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendNetworkManager::access_point_status(bool& active, std::string& profile) {
    active = false;
    profile.clear();

    ProcessResult res =
        exec_nmcli({"-t", "-f", "NAME,TYPE", "connection", "show", "--active"});
    if (!res.ok()) {
        return command_error("active connections", res);
    }

    for (const auto& name : parse_wifi_profiles(res.out)) {
        ProcessResult mode =
            exec_nmcli({"-g", "802-11-wireless.mode", "connection", "show", "id", name});
        if (mode.ok() && trim(mode.out) == "ap") {
            active = true;
            profile = name;
            return WiFiErrorHelper::success();
        }
    }
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendNetworkManager::set_access_point(bool on, const std::string& ssid,
                                                     const std::string& passphrase) {
    if (!running_) {
        return WiFiErrorHelper::not_initialized();
    }

    if (!on) {
        bool active = false;
        std::string profile;
        WiFiError status = access_point_status(active, profile);
        if (!status.success()) {
            return status;
        }
        if (!active) {
            return WiFiErrorHelper::success();
        }
        spdlog::info("[WifiBackend] NM: Stopping access point '{}'", profile);
        ProcessResult res = exec_nmcli({"connection", "down", "id", profile});
        return res.ok() ? WiFiErrorHelper::success() : command_error("hotspot off", res);
    }

    if (!ssid.empty()) {
        // Replace any previous hotspot profile so the new SSID/passphrase apply
        std::vector<std::string> saved;
        if (saved_profiles(saved).success() &&
            std::find(saved.begin(), saved.end(), HOTSPOT_PROFILE) != saved.end()) {
            ProcessResult del = exec_nmcli({"connection", "delete", "id", HOTSPOT_PROFILE});
            if (!del.ok()) {
                return command_error("hotspot replace", del);
            }
        }

        std::vector<std::string> add = {"connection", "add", "type", "wifi", "ifname",
                                        wifi_interface_.empty() ? "*" : wifi_interface_,
                                        "con-name", HOTSPOT_PROFILE, "autoconnect", "no", "ssid",
                                        ssid, "802-11-wireless.mode", "ap",
                                        "802-11-wireless-security.key-mgmt", "wpa-psk",
                                        "802-11-wireless-security.psk", passphrase,
                                        "ipv4.method", "shared"};
        ProcessResult res = exec_nmcli(add);
        if (!res.ok()) {
            return command_error("hotspot create", res);
        }
    } else {
        std::vector<std::string> saved;
        WiFiError listed = saved_profiles(saved);
        if (!listed.success()) {
            return listed;
        }
        if (std::find(saved.begin(), saved.end(), HOTSPOT_PROFILE) == saved.end()) {
            return WiFiErrorHelper::network_not_found(HOTSPOT_PROFILE);
        }
    }

    spdlog::info("[WifiBackend] NM: Starting access point '{}'", HOTSPOT_PROFILE);
    ProcessResult up =
        exec_nmcli({"connection", "up", "id", HOTSPOT_PROFILE}, std::chrono::seconds(30));
    if (!up.ok()) {
        return command_error("hotspot on", up);
    }
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendNetworkManager::radio_enabled(bool& enabled) {
    ProcessResult res = exec_nmcli({"radio", "wifi"});
    if (!res.ok()) {
        return command_error("radio status", res);
    }
    enabled = trim(res.out) == "enabled";
    return WiFiErrorHelper::success();
}

WiFiError WifiBackendNetworkManager::set_radio(bool enabled) {
    spdlog::info("[WifiBackend] NM: Turning radio {}", enabled ? "on" : "off");
    ProcessResult res = exec_nmcli({"radio", "wifi", enabled ? "on" : "off"});
    if (!res.ok()) {
        return command_error("radio toggle", res);
    }
    return WiFiErrorHelper::success();
}

} // namespace wlmenu
