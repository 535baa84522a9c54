// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"
#include "runtime_paths.h"

#include "../test_fixtures.h"

#include <catch2/catch_test_macros.hpp>
#include <fstream>
#include <sstream>

using namespace wlmenu;
using namespace wlmenu::logging;

namespace {

std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    return content.str();
}

// Later tests expect a silent default logger
void install_quiet_logger() {
    LogConfig quiet;
    quiet.enable_console = false;
    quiet.target = LogTarget::Console;
    init(quiet);
}

} // namespace

TEST_CASE("Logging: config log_level names", "[logging][config]") {
    CHECK(parse_level("trace") == spdlog::level::trace);
    CHECK(parse_level("debug") == spdlog::level::debug);
    CHECK(parse_level("info") == spdlog::level::info);
    CHECK(parse_level("warn") == spdlog::level::warn);
    CHECK(parse_level("warning") == spdlog::level::warn);
    CHECK(parse_level("error") == spdlog::level::err);
    CHECK(parse_level("critical") == spdlog::level::critical);
    CHECK(parse_level("off") == spdlog::level::off);

    SECTION("unknown names fall back instead of silencing the log") {
        REQUIRE(parse_level("") == spdlog::level::warn);
        REQUIRE(parse_level("verbose", spdlog::level::info) == spdlog::level::info);
        REQUIRE(parse_level("err", spdlog::level::debug) == spdlog::level::debug);
        REQUIRE(parse_level("DEBUG", spdlog::level::err) == spdlog::level::err);
    }
}

TEST_CASE("Logging: -v flags raise the level one step each", "[logging][config]") {
    REQUIRE(verbosity_to_level(-1) == spdlog::level::warn);
    REQUIRE(verbosity_to_level(0) == spdlog::level::warn);
    REQUIRE(verbosity_to_level(1) == spdlog::level::info);
    REQUIRE(verbosity_to_level(2) == spdlog::level::debug);
    REQUIRE(verbosity_to_level(3) == spdlog::level::trace);
    REQUIRE(verbosity_to_level(9) == spdlog::level::trace);
}

TEST_CASE("Logging: effective level for menu and daemon runs", "[logging][config]") {
    SECTION("wlmenu -vv with log_level=error in the config") {
        REQUIRE(resolve_log_level(2, "error", false) == spdlog::level::debug);
    }

    SECTION("config log_level with no -v") {
        REQUIRE(resolve_log_level(0, "info", false) == spdlog::level::info);
        REQUIRE(resolve_log_level(0, "error", true) == spdlog::level::err);
    }

    SECTION("nothing set: --test is chatty, normal runs only warn") {
        REQUIRE(resolve_log_level(0, "", true) == spdlog::level::debug);
        REQUIRE(resolve_log_level(0, "", false) == spdlog::level::warn);
    }

    SECTION("-v still wins in --test mode") {
        REQUIRE(resolve_log_level(1, "", true) == spdlog::level::info);
    }

    SECTION("a typo in log_level uses the mode default") {
        REQUIRE(resolve_log_level(0, "loud", true) == spdlog::level::debug);
        REQUIRE(resolve_log_level(0, "loud", false) == spdlog::level::warn);
    }
}

TEST_CASE("Logging: --log-dest values", "[logging][config]") {
    for (LogTarget t : {LogTarget::Auto, LogTarget::Journal, LogTarget::Syslog, LogTarget::File,
                        LogTarget::Console}) {
        REQUIRE(parse_log_target(log_target_name(t)) == t);
    }

    SECTION("anything unrecognized is auto") {
        REQUIRE(parse_log_target("") == LogTarget::Auto);
        REQUIRE(parse_log_target("Journal") == LogTarget::Auto);
        REQUIRE(parse_log_target("stdout") == LogTarget::Auto);
    }
}

TEST_CASE("Logging: default log file sits beside the cache and lock", "[logging][config]") {
    RuntimePaths paths = RuntimePaths::in_directory("/run/user/1000/");
    REQUIRE(paths.log_file == "/run/user/1000/wlmenu.log");
}

TEST_CASE("Logging: --log-dest=file", "[logging][init]") {
    TempDir dir;

    SECTION("writes at or above the configured level to the path") {
        std::string path = RuntimePaths::in_directory(dir.path()).log_file;

        LogConfig config;
        config.level = spdlog::level::info;
        config.enable_console = false;
        config.target = LogTarget::File;
        config.file_path = path;
        REQUIRE(init(config) == LogTarget::File);
        REQUIRE(spdlog::default_logger()->level() == spdlog::level::info);

        spdlog::info("[RefreshDaemon] cycle done");
        spdlog::debug("[RefreshDaemon] scan output");
        spdlog::default_logger()->flush();

        std::string content = slurp(path);
        REQUIRE(content.find("[RefreshDaemon] cycle done") != std::string::npos);
        REQUIRE(content.find("[RefreshDaemon] scan output") == std::string::npos);
    }

    SECTION("no path falls back to the console") {
        LogConfig config;
        config.enable_console = false;
        config.target = LogTarget::File;
        REQUIRE(init(config) == LogTarget::Console);
        REQUIRE(spdlog::default_logger()->sinks().empty());
    }

    SECTION("an unwritable path falls back to the console") {
        LogConfig config;
        config.enable_console = false;
        config.target = LogTarget::File;
        config.file_path = dir.file("not-a-dir/wlmenu.log");
        // rotating_file_sink creates missing parents, so the parent is a regular file
        std::ofstream(dir.file("not-a-dir")) << "x";
        REQUIRE(init(config) == LogTarget::Console);
        REQUIRE(spdlog::default_logger()->sinks().empty());
    }

    install_quiet_logger();
}

TEST_CASE("Logging: console target installs only stderr", "[logging][init]") {
    LogConfig config;
    config.target = LogTarget::Console;
    REQUIRE(init(config) == LogTarget::Console);
    REQUIRE(spdlog::default_logger()->sinks().size() == 1);

    install_quiet_logger();
    REQUIRE(spdlog::default_logger()->sinks().empty());
}
