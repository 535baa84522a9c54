// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <cstdlib>
#include <vector>

#ifdef __linux__
#ifdef WLMENU_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace wlmenu {
namespace logging {

namespace {

constexpr const char* IDENT = "wlmenu";

struct TargetName {
    LogTarget target;
    const char* name;
};

constexpr TargetName TARGET_NAMES[] = {
    {LogTarget::Auto, "auto"},       {LogTarget::Journal, "journal"},
    {LogTarget::Syslog, "syslog"},   {LogTarget::File, "file"},
    {LogTarget::Console, "console"},
};

// The runtime dir is usually a small tmpfs
constexpr std::size_t FILE_MAX_BYTES = 1024 * 1024;
constexpr std::size_t FILE_ROTATIONS = 2;

LogTarget resolve_auto() {
#if defined(__linux__) && defined(WLMENU_HAS_SYSTEMD)
    // Set by systemd for services whose stdout/stderr go to the journal
    const char* stream = std::getenv("JOURNAL_STREAM");
    if (stream && stream[0] != '\0') {
        return LogTarget::Journal;
    }
#endif
#ifdef __linux__
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

spdlog::sink_ptr make_file_sink(const std::string& path) {
    if (path.empty()) {
        fprintf(stderr, "[Logging] --log-dest=file without a path, logging to stderr only\n");
        return nullptr;
    }
    try {
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, FILE_MAX_BYTES,
                                                                      FILE_ROTATIONS);
    } catch (const spdlog::spdlog_ex& e) {
        fprintf(stderr, "[Logging] Cannot open %s: %s\n", path.c_str(), e.what());
        return nullptr;
    }
}

spdlog::sink_ptr make_target_sink(LogTarget target, const std::string& file_path) {
    switch (target) {
    case LogTarget::File:
        return make_file_sink(file_path);
#ifdef __linux__
    case LogTarget::Journal:
#ifdef WLMENU_HAS_SYSTEMD
        return std::make_shared<spdlog::sinks::systemd_sink_mt>(IDENT);
#else
        [[fallthrough]];
#endif
    case LogTarget::Syslog:
        return std::make_shared<spdlog::sinks::syslog_sink_mt>(IDENT, LOG_PID, LOG_USER, false);
#endif
    default:
        return nullptr;
    }
}

} // namespace

LogTarget init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    LogTarget target = config.target == LogTarget::Auto ? resolve_auto() : config.target;
    if (spdlog::sink_ptr extra = make_target_sink(target, config.file_path)) {
        sinks.push_back(std::move(extra));
    } else if (target == LogTarget::File) {
        target = LogTarget::Console;
    }

    auto logger = std::make_shared<spdlog::logger>(IDENT, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::debug("[Logging] --log-dest={} level={}{}", log_target_name(target),
                  spdlog::level::to_string_view(config.level),
                  target == LogTarget::File ? " file=" + config.file_path : std::string());
    return target;
}

LogTarget parse_log_target(const std::string& str) {
    for (const auto& entry : TARGET_NAMES) {
        if (str == entry.name) {
            return entry.target;
        }
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    for (const auto& entry : TARGET_NAMES) {
        if (entry.target == target) {
            return entry.name;
        }
    }
    return "unknown";
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    if (str == "warning") {
        return spdlog::level::warn;
    }
    // from_str also takes "err" and turns unknown names into off
    for (const char* name : {"trace", "debug", "info", "warn", "error", "critical", "off"}) {
        if (str == name) {
            return spdlog::level::from_str(str);
        }
    }
    return default_level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    if (verbosity >= 3)
        return spdlog::level::trace;
    if (verbosity == 2)
        return spdlog::level::debug;
    if (verbosity == 1)
        return spdlog::level::info;
    return spdlog::level::warn;
}

spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level,
                                            bool test_mode) {
    if (cli_verbosity > 0) {
        return verbosity_to_level(cli_verbosity);
    }
    spdlog::level::level_enum fallback = test_mode ? spdlog::level::debug : spdlog::level::warn;
    if (!config_level.empty()) {
        return parse_level(config_level, fallback);
    }
    return fallback;
}

} // namespace logging
} // namespace wlmenu
