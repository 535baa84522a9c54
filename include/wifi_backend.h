// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "wifi_types.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wlmenu {

/**
 * @brief Wi-Fi operation result code
 */
enum class WiFiResult {
    SUCCESS = 0,           ///< Operation succeeded
    PERMISSION_DENIED,     ///< Not authorized by NetworkManager/polkit
    SERVICE_NOT_RUNNING,   ///< NetworkManager or nmcli unavailable
    HARDWARE_NOT_AVAILABLE,///< No Wi-Fi device
    RF_KILL_BLOCKED,       ///< Radio disabled
    CONNECTION_FAILED,     ///< Activation failed for a non-credential reason
    TIMEOUT,               ///< Per-call deadline exceeded
    AUTHENTICATION_FAILED, ///< Wrong or missing secret
    NETWORK_NOT_FOUND,     ///< SSID or profile not known
    INVALID_PARAMETERS,    ///< Rejected before reaching the toolkit
    CANCELLED,             ///< Aborted by cancel()
    BACKEND_ERROR,         ///< Toolkit failed or produced unparseable output
    NOT_INITIALIZED,       ///< Backend not started
};

/// Short identifier for logs ("AUTHENTICATION_FAILED", ...)
const char* wifi_result_name(WiFiResult result);

/**
 * @brief Detailed error information for Wi-Fi operations
 *
 * technical_msg goes to the log; user_msg and suggestion are safe to show in the menu.
 */
struct WiFiError {
    WiFiResult result;
    std::string technical_msg;
    std::string user_msg;
    std::string suggestion;

    WiFiError(WiFiResult r = WiFiResult::SUCCESS, const std::string& tech = "",
              const std::string& user = "", const std::string& suggest = "")
        : result(r), technical_msg(tech), user_msg(user), suggestion(suggest) {}

    bool success() const { return result == WiFiResult::SUCCESS; }
    explicit operator bool() const { return success(); }
};

/**
 * @brief Factory functions for the user-facing error texts
 */
class WiFiErrorHelper {
  public:
    static WiFiError success() { return WiFiError(WiFiResult::SUCCESS); }

    static WiFiError permission_denied(const std::string& technical_detail) {
        return WiFiError(WiFiResult::PERMISSION_DENIED, technical_detail,
                         "Permission denied by NetworkManager",
                         "Check polkit rules for your user");
    }

    static WiFiError service_not_running(const std::string& service_name) {
        return WiFiError(WiFiResult::SERVICE_NOT_RUNNING,
                         service_name + " not running or not accessible", "Wi-Fi service unavailable",
                         "Start NetworkManager and try again");
    }

    static WiFiError hardware_not_available() {
        return WiFiError(WiFiResult::HARDWARE_NOT_AVAILABLE, "No Wi-Fi device managed by NetworkManager",
                         "No Wi-Fi hardware found", "Check that the adapter is present and managed");
    }

    static WiFiError rf_kill_blocked() {
        return WiFiError(WiFiResult::RF_KILL_BLOCKED, "Wi-Fi radio is disabled", "Wi-Fi is off",
                         "Turn the radio on from the menu");
    }

    static WiFiError connection_failed(const std::string& technical_detail) {
        return WiFiError(WiFiResult::CONNECTION_FAILED, technical_detail, "Connection failed",
                         "Try again or pick another network");
    }

    static WiFiError authentication_failed(const std::string& ssid) {
        return WiFiError(WiFiResult::AUTHENTICATION_FAILED, "Authentication failed for network: " + ssid,
                         "Incorrect password for '" + ssid + "'", "Verify the password and try again");
    }

    static WiFiError timeout(const std::string& what, std::chrono::seconds after) {
        return WiFiError(WiFiResult::TIMEOUT,
                         what + " timed out after " + std::to_string(after.count()) + "s",
                         "Operation timed out", "Move closer to the access point and retry");
    }

    static WiFiError network_not_found(const std::string& ssid) {
        return WiFiError(WiFiResult::NETWORK_NOT_FOUND, "Network not found: " + ssid,
                         "Network '" + ssid + "' is not in range",
                         "Refresh the list or check the network name");
    }

    static WiFiError invalid_parameters(const std::string& detail) {
        return WiFiError(WiFiResult::INVALID_PARAMETERS, detail, detail);
    }

    static WiFiError cancelled(const std::string& what) {
        return WiFiError(WiFiResult::CANCELLED, what + " cancelled", "Cancelled");
    }

    static WiFiError backend_error(const std::string& technical_detail,
                                   const std::string& user = "Network toolkit error") {
        return WiFiError(WiFiResult::BACKEND_ERROR, technical_detail, user);
    }

    static WiFiError not_initialized() {
        return WiFiError(WiFiResult::NOT_INITIALIZED, "Backend not started", "Wi-Fi backend not ready");
    }
};

/**
 * @brief Network toolkit adapter
 *
 * Every operation is synchronous and bounded by a timeout. Results are returned
 * as WiFiError values; no exceptions cross this interface.
 *
 * Implementations:
 * - WifiBackendNetworkManager: nmcli on Linux
 * - WifiBackendMock: scriptable in-memory backend for --test and unit tests
 *
 * cancel() may be called from any thread and makes the in-flight call (and any
 * call issued before clear_cancel()) return WiFiResult::CANCELLED.
 */
class WifiBackend {
  public:
    virtual ~WifiBackend() = default;

    // ========================================================================
    // Lifecycle Management
    // ========================================================================

    /**
     * @brief Check that the toolkit and the Wi-Fi device are usable
     * @return WiFiError with detailed status information
     */
    virtual WiFiError start() = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;

    // ========================================================================
    // Networks
    // ========================================================================

    /**
     * @brief Rescan and list visible networks
     *
     * Records carry saved/in_use flags but no last_seen stamp; the cache stamps them.
     *
     * @param[out] networks Populated on success, untouched on failure
     */
    virtual WiFiError scan(std::vector<NetworkRecord>& networks) = 0;

    /**
     * @brief Activate a network
     *
     * Without a secret, a saved profile named @p ssid is brought up. With a secret,
     * a fresh profile is created (which NetworkManager keeps even when activation
     * fails; callers are responsible for forgetting it).
     */
    virtual WiFiError connect(const std::string& ssid, const std::optional<std::string>& secret,
                              std::chrono::seconds timeout) = 0;

    virtual WiFiError disconnect(const std::string& ssid) = 0;

    /// Delete the saved profile named @p ssid
    virtual WiFiError forget(const std::string& ssid) = 0;

    /// Names of saved Wi-Fi profiles
    virtual WiFiError saved_profiles(std::vector<std::string>& names) = 0;

    /// SSID of the active Wi-Fi connection; empty when disconnected
    virtual WiFiError active_ssid(std::string& ssid) = 0;

    virtual WiFiError connection_details(const std::string& ssid, ConnectionDetails& details) = 0;

    /// Stored PSK of a saved profile (empty for open networks). Never cached.
    virtual WiFiError saved_secret(const std::string& ssid, std::string& secret) = 0;

    // ========================================================================
    // VPN / Access point / Radio
    // ========================================================================

    virtual WiFiError start_vpn(const std::string& profile) = 0;

    /**
     * @brief Switch the access point
     *
     * on + empty ssid activates the stored hotspot profile; on + ssid creates one.
     */
    virtual WiFiError set_access_point(bool on, const std::string& ssid,
                                       const std::string& passphrase) = 0;

    virtual WiFiError access_point_status(bool& active, std::string& profile) = 0;

    virtual WiFiError radio_enabled(bool& enabled) = 0;
    virtual WiFiError set_radio(bool enabled) = 0;

    /**
     * @brief Reachability check used after connecting and in the details view
     * @param count Echo requests to send
     * @return Average round-trip time, or nullopt if unreachable
     */
    virtual std::optional<double> ping(const std::string& host, int count) = 0;

    // ========================================================================
    // Cancellation
    // ========================================================================

    virtual void cancel() = 0;
    virtual void clear_cancel() = 0;

    /**
     * @brief Create the backend for this process
     *
     * Test mode (--test without --real-wifi) yields the mock backend.
     *
     * @return Started backend, or nullptr when no backend could start
     */
    static std::unique_ptr<WifiBackend> create();
};

} // namespace wlmenu
