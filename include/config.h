// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace wlmenu {

using json = nlohmann::json;

/**
 * @brief Malformed configuration; the process exits before any network action
 */
class ConfigError : public std::runtime_error {
  public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

/// rofi appearance
struct MenuSettings {
    std::string font = "DejaVu Sans Mono 8";
    int location = 0; ///< rofi -location (0 = center .. 8)
    int x_offset = 0;
    int y_offset = 0;
    int max_lines = 8;
};

/**
 * @brief Validated, typed view of the configuration
 */
struct Settings {
    std::chrono::seconds refresh_interval{30};
    std::chrono::seconds connect_timeout{15};
    std::chrono::seconds scan_timeout{10};
    int max_retry = 3;
    bool warn_open_networks = true;
    int stale_after_intervals = 3;
    std::map<std::string, std::string> vpn_bindings; ///< SSID -> VPN profile
    std::string ping_host = "1.1.1.1";
    int ping_count = 2;
    std::string log_level; ///< Empty = not set
    MenuSettings menu;
};

/**
 * @brief Read-only application configuration loaded from JSON
 *
 * Uses JSON pointer syntax (RFC 6901) for value access. The file is never
 * written back; defaults apply for every missing key.
 *
 * Example:
 * ```cpp
 * Config cfg;
 * cfg.load(Config::resolve_path(cli_path, exe_dir));
 * int interval = cfg.get<int>("/refresh_interval_sec", 30);
 * const Settings& s = cfg.settings();
 * ```
 */
class Config {
  protected:
    json data;
    std::string path_;
    Settings settings_;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    static constexpr const char* LOCAL_FILE_NAME = "wlmenu.json";

    Config();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Load and validate a configuration file
     *
     * An empty @p path keeps the built-in defaults.
     *
     * @throws ConfigError when the file cannot be read, is not valid JSON, or a
     *         key has the wrong type or an out-of-range value
     */
    void load(const std::string& path);

    /**
     * @brief Load from an in-memory document (same validation as load())
     * @param source Name used in error messages
     */
    void load_from_string(const std::string& text, const std::string& source = "<string>");

    /**
     * @brief Get configuration value with default fallback
     *
     * @throws nlohmann::json::exception if the value exists with another type
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) const {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr) && !data.at(ptr).is_null()) {
            return data.at(ptr).template get<T>();
        }
        return default_value;
    }

    const Settings& settings() const { return settings_; }

    /// Loaded file, empty when running on defaults
    const std::string& get_path() const { return path_; }

    /**
     * @brief Files considered, in priority order
     *
     * `<exe_dir>/wlmenu.json`, then `$XDG_CONFIG_HOME/wlmenu/config.json`
     * (or `~/.config/wlmenu/config.json`).
     */
    static std::vector<std::string> candidate_paths(const std::string& exe_dir);

    /**
     * @brief Pick the configuration file
     *
     * An explicit path always wins (and must exist when loaded). Otherwise the
     * first existing candidate; empty when none exists.
     */
    static std::string resolve_path(const std::string& explicit_path, const std::string& exe_dir);

    /// Directory of the running executable (/proc/self/exe), empty if unknown
    static std::string executable_dir();

  private:
    /// Rebuild settings_ from data, validating every key
    void build_settings(const std::string& source);
};

} // namespace wlmenu
