// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file logging_init.h
 * @brief spdlog setup for the menu and the daemon
 *
 * Console output goes to stderr so the menu's stdout stays clean. One more
 * sink is chosen by --log-dest.
 */

#include <spdlog/spdlog.h>

#include <string>

namespace wlmenu {
namespace logging {

/// Values of --log-dest
enum class LogTarget {
    Auto,    ///< Journal when the daemon runs under systemd, else syslog
    Journal, ///< needs WLMENU_HAS_SYSTEMD, syslog otherwise
    Syslog,
    File,    ///< Rotating file at LogConfig::file_path
    Console, ///< stderr only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    bool enable_console = true;
    LogTarget target = LogTarget::Auto;
    std::string file_path; ///< --log-file, or RuntimePaths::log_file
};

/**
 * @brief Replace the default logger. Called once per process, again in tests.
 *
 * A File target with an empty or unopenable path degrades to console only and
 * says so on stderr.
 *
 * @return The target actually installed (Auto resolved, File dropped to Console on failure)
 */
LogTarget init(const LogConfig& config);

/// --log-dest value to target; unknown values mean Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/**
 * @brief Parse a level name (case sensitive, "warning" is an alias for "warn")
 * @return @p default_level when unrecognized
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/// 0 (or negative) = warn, 1 = info, 2 = debug, 3+ = trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief Effective level: CLI verbosity, then config, then the mode default
 *
 * The mode default is debug in test mode and warn otherwise.
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level,
                                            bool test_mode);

} // namespace logging
} // namespace wlmenu
