// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for wlmenu
 */

#include <string>

namespace wlmenu {

/**
 * @brief Top-level command (first positional argument)
 */
enum class Command { OPEN_MENU, DAEMON, DAEMON_STOP, SCAN };

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    Command command = Command::OPEN_MENU;

    std::string config_path; // -c/--config, empty = search the default locations
    int timeout_sec = -1;    // -t/--timeout, -1 = use scan_timeout_sec from config

    // Logging
    int verbosity = 0;
    std::string log_dest; // --log-dest, empty = auto
    std::string log_file; // --log-file

    // Test mode
    bool test_mode = false;
    bool use_real_wifi = false;

    bool help = false;
    bool version = false;
};

/**
 * @brief Parse command-line arguments
 *
 * Usage errors are printed to stderr. -h/--help and -V/--version only set
 * their flags; the caller prints and exits.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false on a usage error
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

/**
 * @brief Parse a command name ("open-menu", "daemon", "daemon-stop", "scan")
 * @return false if unknown
 */
bool parse_command(const char* name, Command& out);

const char* command_name(Command command);

void print_help(const char* program_name);

} // namespace wlmenu
