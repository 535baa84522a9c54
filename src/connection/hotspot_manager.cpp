// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "hotspot_manager.h"

#include <spdlog/spdlog.h>

namespace wlmenu {

HotspotManager::HotspotManager(WifiBackend& backend) : backend_(backend) {}

WiFiError HotspotManager::refresh() {
    bool active = false;
    std::string profile;
    WiFiError result = backend_.access_point_status(active, profile);
    if (!result.success()) {
        spdlog::warn("[Hotspot] Status query failed: {}", result.technical_msg);
        return result;
    }
    state_ = active ? State::ON : State::OFF;
    profile_ = active ? profile : "";
    return result;
}

std::string HotspotManager::validate(const std::string& ssid, const std::string& passphrase) {
    if (ssid.empty() || ssid.size() > MAX_SSID) {
        return "Hotspot name must be 1 to 32 bytes";
    }
    if (passphrase.size() < MIN_PASSPHRASE || passphrase.size() > MAX_PASSPHRASE) {
        return "Hotspot password must be 8 to 63 characters";
    }
    for (char ch : passphrase) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 32 || c > 126) {
            return "Hotspot password must be printable ASCII";
        }
    }
    return "";
}

WiFiError HotspotManager::turn_on(const std::string& ssid, const std::string& passphrase) {
    if (state_ == State::ON) {
        spdlog::debug("[Hotspot] Already on ('{}')", profile_);
        return WiFiErrorHelper::success();
    }

    if (!ssid.empty()) {
        std::string reason = validate(ssid, passphrase);
        if (!reason.empty()) {
            return WiFiErrorHelper::invalid_parameters(reason);
        }
    }

    WiFiError result = backend_.set_access_point(true, ssid, passphrase);
    if (!result.success()) {
        spdlog::warn("[Hotspot] Turn on failed: {}", result.technical_msg);
        return result;
    }

    state_ = State::ON;
    // Profile name as reported by the adapter
    bool active = false;
    std::string profile;
    if (backend_.access_point_status(active, profile).success() && active) {
        profile_ = profile;
    }
    spdlog::info("[Hotspot] On ({})", ssid.empty() ? "stored profile" : ssid);
    return result;
}

WiFiError HotspotManager::turn_off() {
    if (state_ == State::OFF) {
        return WiFiErrorHelper::success();
    }

    WiFiError result = backend_.set_access_point(false, "", "");
    if (!result.success()) {
        spdlog::warn("[Hotspot] Turn off failed: {}", result.technical_msg);
        return result;
    }
    state_ = State::OFF;
    profile_.clear();
    spdlog::info("[Hotspot] Off");
    return result;
}

} // namespace wlmenu
