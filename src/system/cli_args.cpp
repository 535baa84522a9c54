// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace wlmenu {

bool parse_command(const char* name, Command& out) {
    if (strcmp(name, "open-menu") == 0 || strcmp(name, "menu") == 0) {
        out = Command::OPEN_MENU;
    } else if (strcmp(name, "daemon") == 0) {
        out = Command::DAEMON;
    } else if (strcmp(name, "daemon-stop") == 0) {
        out = Command::DAEMON_STOP;
    } else if (strcmp(name, "scan") == 0) {
        out = Command::SCAN;
    } else {
        return false;
    }
    return true;
}

const char* command_name(Command command) {
    switch (command) {
    case Command::OPEN_MENU:
        return "open-menu";
    case Command::DAEMON:
        return "daemon";
    case Command::DAEMON_STOP:
        return "daemon-stop";
    case Command::SCAN:
        return "scan";
    }
    return "unknown";
}

// Helper: parse integer with validation
static bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr = nullptr;
    long val = strtol(str, &endptr, 10);
    if (endptr == str || *endptr != '\0' || val < min_val || val > max_val) {
        fprintf(stderr, "Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

// Accepts "--opt value" and "--opt=value"; sets value and advances i
static bool take_value(int argc, char** argv, int& i, const char* long_name, const char* short_name,
                       const char*& value, bool& matched) {
    const char* arg = argv[i];
    size_t long_len = strlen(long_name);

    matched = false;
    if (strncmp(arg, long_name, long_len) == 0 && arg[long_len] == '=') {
        matched = true;
        value = arg + long_len + 1;
        return true;
    }
    if (strcmp(arg, long_name) == 0 || (short_name && strcmp(arg, short_name) == 0)) {
        matched = true;
        if (i + 1 >= argc) {
            fprintf(stderr, "Error: %s requires an argument\n", long_name);
            return false;
        }
        value = argv[++i];
        return true;
    }
    return true;
}

void print_help(const char* program_name) {
    printf("Usage: %s [options] [open-menu|daemon|daemon-stop|scan]\n", program_name);
    printf("\nCommands:\n");
    printf("  open-menu            Show the Wi-Fi menu (default)\n");
    printf("  daemon               Run the background refresh loop in the foreground\n");
    printf("  daemon-stop          Stop the running daemon and wait for it to exit\n");
    printf("  scan                 Ask the daemon for an immediate refresh and wait for it\n");
    printf("\nOptions:\n");
    printf("  -c, --config <path>  Configuration file (default: search standard locations)\n");
    printf("  -t, --timeout <sec>  How long scan/daemon-stop wait (1-3600)\n");
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>    Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>    Log file for --log-dest=file (default: <runtime dir>/wlmenu.log)\n");
    printf("  -h, --help           Show this help message\n");
    printf("  -V, --version        Show version information\n");
    printf("\nTest Mode Options:\n");
    printf("  --test               Enable test mode (mock Wi-Fi backend)\n");
    printf("    --real-wifi        Use NetworkManager even in test mode (requires --test)\n");
    printf("\nExit codes:\n");
    printf("  0 success, 1 operation failed or daemon not running,\n");
    printf("  2 usage or configuration error, 3 daemon already running\n");
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    bool command_seen = false;

    for (int i = 1; i < argc; i++) {
        const char* value = nullptr;
        bool matched = false;

        // Config file
        if (!take_value(argc, argv, i, "--config", "-c", value, matched))
            return false;
        if (matched) {
            if (value[0] == '\0') {
                fprintf(stderr, "Error: --config requires a non-empty path\n");
                return false;
            }
            args.config_path = value;
            continue;
        }

        // Wait bound
        if (!take_value(argc, argv, i, "--timeout", "-t", value, matched))
            return false;
        if (matched) {
            if (!parse_int(value, 1, 3600, args.timeout_sec, "--timeout"))
                return false;
            continue;
        }

        // Logging
        if (!take_value(argc, argv, i, "--log-dest", nullptr, value, matched))
            return false;
        if (matched) {
            if (strcmp(value, "auto") != 0 && strcmp(value, "journal") != 0 &&
                strcmp(value, "syslog") != 0 && strcmp(value, "file") != 0 &&
                strcmp(value, "console") != 0) {
                fprintf(stderr,
                        "Error: invalid --log-dest (auto, journal, syslog, file, console): %s\n",
                        value);
                return false;
            }
            args.log_dest = value;
            continue;
        }

        if (!take_value(argc, argv, i, "--log-file", nullptr, value, matched))
            return false;
        if (matched) {
            args.log_file = value;
            continue;
        }

        const char* arg = argv[i];

        // Verbosity: -v, -vv, -vvv or repeated --verbose
        if (strcmp(arg, "--verbose") == 0) {
            args.verbosity++;
        } else if (arg[0] == '-' && arg[1] == 'v' && strspn(arg + 1, "v") == strlen(arg + 1)) {
            args.verbosity += static_cast<int>(strlen(arg + 1));
        }
        // Test mode
        else if (strcmp(arg, "--test") == 0) {
            args.test_mode = true;
        } else if (strcmp(arg, "--real-wifi") == 0) {
            args.use_real_wifi = true;
        }
        // Help
        else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.help = true;
        }
        // Version
        else if (strcmp(arg, "-V") == 0 || strcmp(arg, "--version") == 0) {
            args.version = true;
        }
        // Positional: command
        else if (arg[0] != '-') {
            if (command_seen) {
                fprintf(stderr, "Error: only one command allowed (got '%s' after '%s')\n", arg,
                        command_name(args.command));
                return false;
            }
            if (!parse_command(arg, args.command)) {
                fprintf(stderr, "Unknown command: %s\n", arg);
                fprintf(stderr, "Use --help for usage information\n");
                return false;
            }
            command_seen = true;
        }
        // Unknown argument
        else {
            fprintf(stderr, "Unknown argument: %s\n", arg);
            fprintf(stderr, "Use --help for usage information\n");
            return false;
        }
    }

    if (args.use_real_wifi && !args.test_mode) {
        fprintf(stderr, "Error: --real-wifi requires --test mode\n");
        return false;
    }

    return true;
}

} // namespace wlmenu
