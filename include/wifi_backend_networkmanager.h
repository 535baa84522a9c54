// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "process_runner.h"
#include "wifi_backend.h"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace wlmenu {

/**
 * @brief NetworkManager backend using the nmcli command-line interface
 *
 * Uses `nmcli --terse` for stable, machine-parseable output. Every command is
 * run through run_process() (fork/exec, no shell), so SSIDs and secrets never
 * pass through a shell. Commands run with LC_ALL=C so error texts can be
 * classified.
 *
 * All calls are synchronous and bounded; cancel() terminates the running nmcli.
 */
class WifiBackendNetworkManager : public WifiBackend {
    friend class TestableNMBackend; // Unit test access to private parsing methods

  public:
    /// Name of the profile created by set_access_point()
    static constexpr const char* HOTSPOT_PROFILE = "Hotspot";

    WifiBackendNetworkManager();
    ~WifiBackendNetworkManager() override;

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

  private:
    // nmcli exit codes (nmcli(1) "EXIT STATUS")
    static constexpr int NMCLI_EXIT_ACTIVATION_FAILED = 4;
    static constexpr int NMCLI_EXIT_TIMEOUT = 3;
    static constexpr int NMCLI_EXIT_NOT_FOUND = 10;

    std::atomic<bool> running_{false};
    std::atomic<bool> cancel_requested_{false};
    std::string wifi_interface_; ///< Detected Wi-Fi interface (e.g., "wlan0")

    // ========================================================================
    // Internal Helpers
    // ========================================================================

    /**
     * @brief Run nmcli with the given arguments
     * @param args Arguments after "nmcli"
     * @param timeout Process deadline
     */
    ProcessResult exec_nmcli(const std::vector<std::string>& args,
                             std::chrono::milliseconds timeout = std::chrono::seconds(10));

    /// Map a failed non-connect nmcli run onto a WiFiError
    WiFiError command_error(const std::string& what, const ProcessResult& res) const;

    WiFiError check_system_prerequisites();
    std::string detect_wifi_interface();

    /// Arguments selecting the Wi-Fi interface, or nothing when none was detected
    std::vector<std::string> ifname_args() const;

    /**
     * @brief Parse a single nmcli terse-mode line, respecting escaped colons
     *
     * nmcli -t uses ':' as field separator but escapes literal colons as '\:'
     * and backslashes as '\\'.
     */
    static std::vector<std::string> split_nmcli_fields(const std::string& line);

    /**
     * @brief Parse `-t -f IN-USE,SSID,SIGNAL,SECURITY device wifi list`
     *
     * Hidden SSIDs and malformed lines are skipped. Duplicates are kept; the
     * cache normalizes them.
     */
    static std::vector<NetworkRecord> parse_scan_output(const std::string& output);

    /// Names of `802-11-wireless` profiles from `-t -f NAME,TYPE connection show`
    static std::vector<std::string> parse_wifi_profiles(const std::string& output);

    /// Fill ip/gateway/dns from `-t -f IP4.ADDRESS,IP4.GATEWAY,IP4.DNS device show`
    static void parse_ip4_details(const std::string& output, ConnectionDetails& details);

    /// Average rtt from `ping` summary output ("rtt min/avg/max/mdev = a/b/c/d ms")
    static std::optional<double> parse_ping_output(const std::string& output);

    /**
     * @brief Classify a failed connect run
     *
     * Credential problems (secrets, password, authentication, 802-11-wireless-security
     * in the error text) become AUTHENTICATION_FAILED; deadline expiry becomes TIMEOUT;
     * unknown SSID becomes NETWORK_NOT_FOUND; everything else CONNECTION_FAILED carrying
     * the last stderr line as technical detail.
     */
    static WiFiError classify_connect_failure(const std::string& ssid, const ProcessResult& res,
                                              std::chrono::seconds timeout);

    /**
     * @brief Validate SSID/password for sanity
     *
     * Rejects control characters, null bytes, excessive length.
     * @return Validated string, or empty on failure
     */
    static std::string validate_input(const std::string& input, const std::string& field_name);
};

} // namespace wlmenu
