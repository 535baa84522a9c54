// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace wlmenu {

namespace {

std::string error_prefix(const std::string& source, const std::string& key) {
    return source + ": " + key;
}

/// Integer at @p ptr within [lo, hi], or @p def when absent
int get_int_in_range(const json& data, const std::string& source, const std::string& ptr, int def,
                     int lo, int hi) {
    json::json_pointer jp(ptr);
    if (!data.contains(jp) || data.at(jp).is_null()) {
        return def;
    }
    const json& v = data.at(jp);
    if (!v.is_number_integer()) {
        throw ConfigError(error_prefix(source, ptr) + " must be an integer");
    }
    long long value = v.get<long long>();
    if (value < lo || value > hi) {
        throw ConfigError(error_prefix(source, ptr) + " must be between " + std::to_string(lo) +
                          " and " + std::to_string(hi) + " (got " + std::to_string(value) + ")");
    }
    return static_cast<int>(value);
}

bool get_bool(const json& data, const std::string& source, const std::string& ptr, bool def) {
    json::json_pointer jp(ptr);
    if (!data.contains(jp) || data.at(jp).is_null()) {
        return def;
    }
    const json& v = data.at(jp);
    if (!v.is_boolean()) {
        throw ConfigError(error_prefix(source, ptr) + " must be true or false");
    }
    return v.get<bool>();
}

std::string get_string(const json& data, const std::string& source, const std::string& ptr,
                       const std::string& def) {
    json::json_pointer jp(ptr);
    if (!data.contains(jp) || data.at(jp).is_null()) {
        return def;
    }
    const json& v = data.at(jp);
    if (!v.is_string()) {
        throw ConfigError(error_prefix(source, ptr) + " must be a string");
    }
    return v.get<std::string>();
}

bool is_known_level(const std::string& level) {
    static const char* levels[] = {"trace", "debug",    "info", "warn",
                                   "warning", "error", "critical", "off"};
    for (const char* l : levels) {
        if (level == l) {
            return true;
        }
    }
    return false;
}

} // namespace

Config::Config() : data(json::object()) {}

void Config::load(const std::string& path) {
    if (path.empty()) {
        spdlog::debug("[Config] No config file, using defaults");
        data = json::object();
        path_.clear();
        build_settings("<defaults>");
        return;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError(path + ": cannot open file");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    load_from_string(buffer.str(), path);
    path_ = path;
    spdlog::info("[Config] Loaded {}", path);
}

void Config::load_from_string(const std::string& text, const std::string& source) {
    json parsed;
    try {
        parsed = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(source + ": invalid JSON: " + e.what());
    }
    if (!parsed.is_object()) {
        throw ConfigError(source + ": top level must be a JSON object");
    }

    data = std::move(parsed);
    build_settings(source);
}

void Config::build_settings(const std::string& source) {
    Settings s;

    s.refresh_interval =
        std::chrono::seconds(get_int_in_range(data, source, "/refresh_interval_sec", 30, 1, 86400));
    s.connect_timeout =
        std::chrono::seconds(get_int_in_range(data, source, "/connect_timeout_sec", 15, 1, 600));
    s.scan_timeout =
        std::chrono::seconds(get_int_in_range(data, source, "/scan_timeout_sec", 10, 1, 600));
    s.max_retry = get_int_in_range(data, source, "/max_retry", 3, 1, 10);
    s.warn_open_networks = get_bool(data, source, "/warn_open_networks", true);
    s.stale_after_intervals = get_int_in_range(data, source, "/stale_after_intervals", 3, 1, 1000);
    s.ping_host = get_string(data, source, "/ping_host", "1.1.1.1");
    s.ping_count = get_int_in_range(data, source, "/ping_count", 2, 1, 20);

    s.log_level = get_string(data, source, "/log_level", "");
    if (!s.log_level.empty() && !is_known_level(s.log_level)) {
        throw ConfigError(error_prefix(source, "/log_level") + " unknown level '" + s.log_level +
                          "'");
    }

    if (data.contains("vpn_bindings") && !data["vpn_bindings"].is_null()) {
        const json& bindings = data["vpn_bindings"];
        if (!bindings.is_object()) {
            throw ConfigError(error_prefix(source, "/vpn_bindings") +
                              " must be an object of SSID -> VPN profile");
        }
        for (auto it = bindings.begin(); it != bindings.end(); ++it) {
            if (!it.value().is_string() || it.value().get<std::string>().empty()) {
                throw ConfigError(error_prefix(source, "/vpn_bindings/" + it.key()) +
                                  " must be a non-empty profile name");
            }
            s.vpn_bindings[it.key()] = it.value().get<std::string>();
        }
    }

    if (data.contains("menu") && !data["menu"].is_null() && !data["menu"].is_object()) {
        throw ConfigError(error_prefix(source, "/menu") + " must be an object");
    }
    s.menu.font = get_string(data, source, "/menu/font", s.menu.font);
    s.menu.location = get_int_in_range(data, source, "/menu/location", 0, 0, 8);
    s.menu.x_offset = get_int_in_range(data, source, "/menu/x_offset", 0, -10000, 10000);
    s.menu.y_offset = get_int_in_range(data, source, "/menu/y_offset", 0, -10000, 10000);
    s.menu.max_lines = get_int_in_range(data, source, "/menu/max_lines", 8, 1, 100);

    settings_ = std::move(s);
    spdlog::debug("[Config] interval={}s timeout={}s max_retry={} vpn_bindings={}",
                  settings_.refresh_interval.count(), settings_.connect_timeout.count(),
                  settings_.max_retry, settings_.vpn_bindings.size());
}

// ============================================================================
// Path resolution
// ============================================================================

std::string Config::executable_dir() {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return "";
    }
    return exe.parent_path().string();
}

std::vector<std::string> Config::candidate_paths(const std::string& exe_dir) {
    std::vector<std::string> paths;
    if (!exe_dir.empty()) {
        paths.push_back((fs::path(exe_dir) / LOCAL_FILE_NAME).string());
    }

    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        paths.push_back(std::string(xdg) + "/wlmenu/config.json");
    } else {
        const char* home = std::getenv("HOME");
        if (home && home[0] != '\0') {
            paths.push_back(std::string(home) + "/.config/wlmenu/config.json");
        }
    }
    return paths;
}

std::string Config::resolve_path(const std::string& explicit_path, const std::string& exe_dir) {
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    for (const auto& candidate : candidate_paths(exe_dir)) {
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            spdlog::debug("[Config] Using {}", candidate);
            return candidate;
        }
    }
    return "";
}

} // namespace wlmenu
