// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_cli_args.cpp
 * @brief Unit tests for command-line parsing
 */

#include "cli_args.h"

#include "../test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

namespace {

/// Owns mutable argv storage for parse_cli_args()
class Argv {
  public:
    Argv(std::initializer_list<const char*> args) {
        storage_.emplace_back("wlmenu");
        for (const char* a : args) {
            storage_.emplace_back(a);
        }
        for (auto& s : storage_) {
            ptrs_.push_back(&s[0]);
        }
        ptrs_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return ptrs_.data(); }

  private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

bool parse(std::initializer_list<const char*> args, CliArgs& out) {
    Argv argv(args);
    return parse_cli_args(argv.argc(), argv.argv(), out);
}

} // namespace

// ============================================================================
// Commands
// ============================================================================

TEST_CASE("CLI args: default command opens the menu", "[cli_args]") {
    CliArgs args;
    REQUIRE(parse({}, args));
    REQUIRE(args.command == Command::OPEN_MENU);
    REQUIRE(args.timeout_sec == -1);
    REQUIRE(args.verbosity == 0);
    REQUIRE_FALSE(args.test_mode);
}

TEST_CASE("CLI args: commands", "[cli_args]") {
    CliArgs args;

    SECTION("open-menu") {
        REQUIRE(parse({"open-menu"}, args));
        REQUIRE(args.command == Command::OPEN_MENU);
    }

    SECTION("menu alias") {
        REQUIRE(parse({"menu"}, args));
        REQUIRE(args.command == Command::OPEN_MENU);
    }

    SECTION("daemon") {
        REQUIRE(parse({"daemon"}, args));
        REQUIRE(args.command == Command::DAEMON);
    }

    SECTION("daemon-stop") {
        REQUIRE(parse({"daemon-stop"}, args));
        REQUIRE(args.command == Command::DAEMON_STOP);
    }

    SECTION("scan") {
        REQUIRE(parse({"scan"}, args));
        REQUIRE(args.command == Command::SCAN);
    }
}

TEST_CASE("CLI args: command name round trip", "[cli_args]") {
    for (Command c : {Command::OPEN_MENU, Command::DAEMON, Command::DAEMON_STOP, Command::SCAN}) {
        Command parsed = Command::OPEN_MENU;
        REQUIRE(parse_command(command_name(c), parsed));
        REQUIRE(parsed == c);
    }

    Command unused = Command::SCAN;
    REQUIRE_FALSE(parse_command("start", unused));
    REQUIRE(unused == Command::SCAN);
}

// ============================================================================
// Options
// ============================================================================

TEST_CASE("CLI args: options with values", "[cli_args]") {
    CliArgs args;

    SECTION("separate values") {
        REQUIRE(parse({"-c", "/tmp/w.json", "--timeout", "20", "--log-dest", "file", "--log-file",
                       "/tmp/w.log", "scan"},
                      args));
        REQUIRE(args.config_path == "/tmp/w.json");
        REQUIRE(args.timeout_sec == 20);
        REQUIRE(args.log_dest == "file");
        REQUIRE(args.log_file == "/tmp/w.log");
        REQUIRE(args.command == Command::SCAN);
    }

    SECTION("--opt=value form") {
        REQUIRE(parse({"--config=/etc/w.json", "--timeout=5", "--log-dest=console"}, args));
        REQUIRE(args.config_path == "/etc/w.json");
        REQUIRE(args.timeout_sec == 5);
        REQUIRE(args.log_dest == "console");
    }

    SECTION("options may follow the command") {
        REQUIRE(parse({"daemon", "-t", "7"}, args));
        REQUIRE(args.command == Command::DAEMON);
        REQUIRE(args.timeout_sec == 7);
    }
}

TEST_CASE("CLI args: verbosity", "[cli_args]") {
    CliArgs args;

    SECTION("-v") {
        REQUIRE(parse({"-v"}, args));
        REQUIRE(args.verbosity == 1);
    }

    SECTION("-vvv") {
        REQUIRE(parse({"-vvv"}, args));
        REQUIRE(args.verbosity == 3);
    }

    SECTION("repeated flags add up") {
        REQUIRE(parse({"-v", "--verbose", "-vv"}, args));
        REQUIRE(args.verbosity == 4);
    }
}

TEST_CASE("CLI args: help and version only set flags", "[cli_args]") {
    CliArgs args;

    REQUIRE(parse({"--help"}, args));
    REQUIRE(args.help);

    CliArgs other;
    REQUIRE(parse({"-V"}, other));
    REQUIRE(other.version);
    REQUIRE_FALSE(other.help);
}

TEST_CASE("CLI args: test mode", "[cli_args]") {
    CliArgs args;

    SECTION("--test") {
        REQUIRE(parse({"--test"}, args));
        REQUIRE(args.test_mode);
        REQUIRE_FALSE(args.use_real_wifi);
    }

    SECTION("--test --real-wifi") {
        REQUIRE(parse({"--test", "--real-wifi"}, args));
        REQUIRE(args.use_real_wifi);
    }

    SECTION("--real-wifi alone is a usage error") {
        REQUIRE_FALSE(parse({"--real-wifi"}, args));
    }
}

// ============================================================================
// Usage errors
// ============================================================================

TEST_CASE("CLI args: usage errors", "[cli_args]") {
    CliArgs args;

    SECTION("unknown command") {
        REQUIRE_FALSE(parse({"connect"}, args));
    }

    SECTION("two commands") {
        REQUIRE_FALSE(parse({"scan", "daemon"}, args));
    }

    SECTION("unknown option") {
        REQUIRE_FALSE(parse({"--frobnicate"}, args));
    }

    SECTION("missing value") {
        REQUIRE_FALSE(parse({"--config"}, args));
        REQUIRE_FALSE(parse({"-t"}, args));
    }

    SECTION("empty config path") {
        REQUIRE_FALSE(parse({"--config="}, args));
    }

    SECTION("timeout out of range or not a number") {
        REQUIRE_FALSE(parse({"-t", "0"}, args));
        REQUIRE_FALSE(parse({"-t", "3601"}, args));
        REQUIRE_FALSE(parse({"-t", "10s"}, args));
        REQUIRE_FALSE(parse({"--timeout="}, args));
    }

    SECTION("bad log destination") {
        REQUIRE_FALSE(parse({"--log-dest", "stdout"}, args));
    }
}
