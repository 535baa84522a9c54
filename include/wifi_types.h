// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file wifi_types.h
 * @brief Value types shared by the cache, the daemon and the menu
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wlmenu {

/**
 * @brief Security kind advertised by an access point
 *
 * UNKNOWN means "secured, but with a scheme we do not classify".
 */
enum class SecurityKind { OPEN, WEP, WPA, WPA2, WPA3, ENTERPRISE, UNKNOWN };

/**
 * @brief Classify a NetworkManager SECURITY column ("WPA2 802.1X", "WPA1 WPA2", "--", ...)
 *
 * Strongest scheme wins. Enterprise is reported whenever 802.1X or EAP is present.
 */
SecurityKind parse_security(const std::string& nm_security);

/// Canonical name used in the cache file and menu rows ("Open", "WPA2", ...)
const char* security_name(SecurityKind kind);

/// Inverse of security_name(); unrecognized names map to UNKNOWN
SecurityKind security_from_name(const std::string& name);

/// True for every kind that needs a secret to join
inline bool needs_secret(SecurityKind kind) {
    return kind != SecurityKind::OPEN;
}

/**
 * @brief One observed network at one scan moment
 */
struct NetworkRecord {
    std::string ssid;
    SecurityKind security = SecurityKind::UNKNOWN;
    int signal_strength = 0; ///< Normalized 0-100
    bool saved = false;      ///< A saved profile with this name exists
    bool in_use = false;     ///< Currently connected network
    int64_t last_seen = 0;   ///< Unix seconds

    bool operator==(const NetworkRecord& o) const {
        return ssid == o.ssid && security == o.security &&
               signal_strength == o.signal_strength && saved == o.saved && in_use == o.in_use &&
               last_seen == o.last_seen;
    }
    bool operator!=(const NetworkRecord& o) const { return !(*this == o); }
};

/**
 * @brief Immutable view of all known networks at one scan moment
 */
struct CacheSnapshot {
    uint64_t generation = 0;
    int64_t scan_timestamp = 0;
    std::vector<NetworkRecord> networks;

    /// Every record shares the scan timestamp and carries a sane signal value
    bool is_consistent() const;

    /// Record for @p ssid, or nullptr
    const NetworkRecord* find(const std::string& ssid) const;

    /// Record flagged in_use, or nullptr
    const NetworkRecord* active() const;
};

/**
 * @brief Order records for display: in-use first, then by descending signal,
 *        keeping only the strongest entry per SSID. Hidden (empty) SSIDs are dropped.
 */
std::vector<NetworkRecord> normalize_records(std::vector<NetworkRecord> records);

/**
 * @brief Details of the active connection (menu "details" action)
 */
struct ConnectionDetails {
    std::string ssid;
    std::string ip_address;
    std::string gateway;
    std::vector<std::string> dns;
    SecurityKind security = SecurityKind::UNKNOWN;
    int signal_strength = 0;
    std::optional<double> latency_ms; ///< Empty when the ping host did not answer
};

} // namespace wlmenu
