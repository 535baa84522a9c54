// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "wifi_backend.h"

#include <string>

namespace wlmenu {

/**
 * @brief Access point on/off state machine
 *
 * ```
 *   OFF --turn_on()--> ON
 *    ^                 |
 *    +---turn_off()----+
 * ```
 *
 * The state mirrors the adapter: refresh() reads it, and a transition only
 * happens when the adapter call succeeds. Adapter errors are returned as-is;
 * nothing is retried.
 */
class HotspotManager {
  public:
    enum class State { OFF, ON };

    static constexpr size_t MIN_PASSPHRASE = 8;
    static constexpr size_t MAX_PASSPHRASE = 63;
    static constexpr size_t MAX_SSID = 32;

    explicit HotspotManager(WifiBackend& backend);

    /// Re-read the state from the adapter
    WiFiError refresh();

    /**
     * @brief Start the access point
     *
     * Empty @p ssid activates the stored hotspot profile; otherwise a new profile
     * is created from @p ssid and @p passphrase, which are validated first.
     * Already ON is a successful no-op.
     */
    WiFiError turn_on(const std::string& ssid = "", const std::string& passphrase = "");

    /// Stop the access point; already OFF is a successful no-op
    WiFiError turn_off();

    State state() const { return state_; }
    const std::string& active_profile() const { return profile_; }

    /// Empty when valid, else a user-facing reason
    static std::string validate(const std::string& ssid, const std::string& passphrase);

  private:
    WifiBackend& backend_;
    State state_ = State::OFF;
    std::string profile_;
};

} // namespace wlmenu
