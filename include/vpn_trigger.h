// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "wifi_backend.h"

#include <map>
#include <optional>
#include <string>

namespace wlmenu {

/// Result of the post-connect VPN hand-off
struct VpnActivation {
    std::string profile;
    WiFiError result;
};

/**
 * @brief SSID -> VPN profile policy applied after a successful connect
 *
 * Bindings are fixed at construction. A failed VPN start is reported and never
 * undoes the Wi-Fi connection.
 */
class VpnTrigger {
  public:
    using Bindings = std::map<std::string, std::string>;

    VpnTrigger(WifiBackend& backend, Bindings bindings);

    /// Bound profile for @p ssid, or nullopt
    std::optional<std::string> profile_for(const std::string& ssid) const;

    /**
     * @brief Start the bound VPN, if any
     *
     * Issues exactly one start_vpn() when @p ssid is bound, none otherwise.
     */
    std::optional<VpnActivation> activate_for(const std::string& ssid);

    const Bindings& bindings() const { return bindings_; }

  private:
    WifiBackend& backend_;
    const Bindings bindings_;
};

} // namespace wlmenu
