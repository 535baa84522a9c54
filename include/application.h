// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cli_args.h"
#include "runtime_paths.h"

#include <chrono>
#include <memory>

// Forward declarations
namespace wlmenu {
class Config;
class WifiBackend;
} // namespace wlmenu

/**
 * @brief Process entry point for every wlmenu command
 *
 * Application runs the startup phases in order, then dispatches the command:
 * 1. Parse CLI args and configure runtime settings
 * 2. Load and validate the configuration (exit 2 on error)
 * 3. Initialize logging
 * 4. Run open-menu, daemon, daemon-stop or scan
 *
 * Usage:
 *   Application app;
 *   return app.run(argc, argv);
 */
class Application {
  public:
    /// Process exit codes
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_FAILED = 1;
    static constexpr int EXIT_USAGE = 2;
    static constexpr int EXIT_ALREADY_RUNNING = 3;

    Application();
    ~Application();

    // Non-copyable, non-movable
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * @brief Run the application
     * @param argc Command line argument count
     * @param argv Command line argument array
     * @return Exit code (see EXIT_*)
     */
    int run(int argc, char** argv);

  private:
    // Initialization phases
    bool parse_args(int argc, char** argv);
    bool init_config();
    void init_logging();

    // Commands
    int run_menu();
    int run_daemon();
    int run_daemon_stop();
    int run_scan();

    /// Wait bound for scan/daemon-stop: --timeout, else scan_timeout_sec
    std::chrono::milliseconds wait_timeout() const;

    std::unique_ptr<wlmenu::Config> m_config;
    wlmenu::CliArgs m_args;
    wlmenu::RuntimePaths m_paths;
};
