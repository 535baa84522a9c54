// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_types.h"

#include <algorithm>
#include <unordered_map>

namespace wlmenu {

SecurityKind parse_security(const std::string& nm_security) {
    if (nm_security.empty() || nm_security == "--") {
        return SecurityKind::OPEN;
    }
    if (nm_security.find("802.1X") != std::string::npos ||
        nm_security.find("EAP") != std::string::npos) {
        return SecurityKind::ENTERPRISE;
    }
    if (nm_security.find("WPA3") != std::string::npos ||
        nm_security.find("SAE") != std::string::npos) {
        return SecurityKind::WPA3;
    }
    if (nm_security.find("WPA2") != std::string::npos) {
        return SecurityKind::WPA2;
    }
    if (nm_security.find("WPA") != std::string::npos) {
        return SecurityKind::WPA;
    }
    if (nm_security.find("WEP") != std::string::npos) {
        return SecurityKind::WEP;
    }
    return SecurityKind::UNKNOWN;
}

const char* security_name(SecurityKind kind) {
    switch (kind) {
    case SecurityKind::OPEN:
        return "Open";
    case SecurityKind::WEP:
        return "WEP";
    case SecurityKind::WPA:
        return "WPA";
    case SecurityKind::WPA2:
        return "WPA2";
    case SecurityKind::WPA3:
        return "WPA3";
    case SecurityKind::ENTERPRISE:
        return "Enterprise";
    case SecurityKind::UNKNOWN:
        return "Secured";
    }
    return "Secured";
}

SecurityKind security_from_name(const std::string& name) {
    static const SecurityKind all[] = {SecurityKind::OPEN, SecurityKind::WEP,
                                       SecurityKind::WPA,  SecurityKind::WPA2,
                                       SecurityKind::WPA3, SecurityKind::ENTERPRISE};
    for (SecurityKind k : all) {
        if (name == security_name(k)) {
            return k;
        }
    }
    return SecurityKind::UNKNOWN;
}

bool CacheSnapshot::is_consistent() const {
    for (const auto& rec : networks) {
        if (rec.last_seen != scan_timestamp) {
            return false;
        }
        if (rec.signal_strength < 0 || rec.signal_strength > 100) {
            return false;
        }
        if (rec.ssid.empty()) {
            return false;
        }
    }
    return true;
}

const NetworkRecord* CacheSnapshot::find(const std::string& ssid) const {
    for (const auto& rec : networks) {
        if (rec.ssid == ssid) {
            return &rec;
        }
    }
    return nullptr;
}

const NetworkRecord* CacheSnapshot::active() const {
    for (const auto& rec : networks) {
        if (rec.in_use) {
            return &rec;
        }
    }
    return nullptr;
}

std::vector<NetworkRecord> normalize_records(std::vector<NetworkRecord> records) {
    // Deduplicate by SSID: several BSSIDs of one network collapse into the strongest.
    // in_use and saved flags are sticky across duplicates.
    std::unordered_map<std::string, size_t> index;
    std::vector<NetworkRecord> unique;
    unique.reserve(records.size());

    for (auto& rec : records) {
        if (rec.ssid.empty()) {
            continue;
        }
        rec.signal_strength = std::clamp(rec.signal_strength, 0, 100);
        auto it = index.find(rec.ssid);
        if (it == index.end()) {
            index.emplace(rec.ssid, unique.size());
            unique.push_back(std::move(rec));
            continue;
        }
        NetworkRecord& kept = unique[it->second];
        bool in_use = kept.in_use || rec.in_use;
        bool saved = kept.saved || rec.saved;
        if (rec.signal_strength > kept.signal_strength) {
            kept = std::move(rec);
        }
        kept.in_use = in_use;
        kept.saved = saved;
    }

    std::stable_sort(unique.begin(), unique.end(),
                     [](const NetworkRecord& a, const NetworkRecord& b) {
                         if (a.in_use != b.in_use) {
                             return a.in_use;
                         }
                         return a.signal_strength > b.signal_strength;
                     });
    return unique;
}

} // namespace wlmenu
