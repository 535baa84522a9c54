// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "vpn_trigger.h"

#include <spdlog/spdlog.h>

namespace wlmenu {

VpnTrigger::VpnTrigger(WifiBackend& backend, Bindings bindings)
    : backend_(backend), bindings_(std::move(bindings)) {}

std::optional<std::string> VpnTrigger::profile_for(const std::string& ssid) const {
    auto it = bindings_.find(ssid);
    if (it == bindings_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<VpnActivation> VpnTrigger::activate_for(const std::string& ssid) {
    auto profile = profile_for(ssid);
    if (!profile) {
        spdlog::trace("[VPN] No binding for '{}'", ssid);
        return std::nullopt;
    }

    spdlog::info("[VPN] '{}' is bound to '{}', starting it", ssid, *profile);
    VpnActivation activation;
    activation.profile = *profile;
    activation.result = backend_.start_vpn(*profile);
    if (!activation.result.success()) {
        spdlog::warn("[VPN] Failed to start '{}': {} (Wi-Fi stays connected)", *profile,
                     activation.result.technical_msg);
    }
    return activation;
}

} // namespace wlmenu
