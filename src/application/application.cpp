// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "application.h"

#include "config.h"
#include "daemon_lock.h"
#include "logging_init.h"
#include "menu_controller.h"
#include "notifier.h"
#include "process_runner.h"
#include "refresh_client.h"
#include "refresh_daemon.h"
#include "rofi_presenter.h"
#include "runtime_config.h"
#include "signal_listener.h"
#include "state_cache.h"
#include "wifi_backend.h"

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdio>
#include <unistd.h>

using namespace wlmenu;

#ifndef WLMENU_VERSION
#define WLMENU_VERSION "dev"
#endif

Application::Application() = default;

Application::~Application() = default;

int Application::run(int argc, char** argv) {
    // Quiet until the configured level is known
    spdlog::set_level(spdlog::level::warn);

    // Writes to a child that already exited must fail with EPIPE, not kill us
    std::signal(SIGPIPE, SIG_IGN);

    // Phase 1: Parse command line args
    if (!parse_args(argc, argv)) {
        return EXIT_USAGE;
    }
    if (m_args.help) {
        print_help(argv[0]);
        return EXIT_OK;
    }
    if (m_args.version) {
        printf("wlmenu %s\n", WLMENU_VERSION);
        return EXIT_OK;
    }

    // Phase 2: Load configuration (before any network action)
    if (!init_config()) {
        return EXIT_USAGE;
    }

    // Phase 3: Initialize logging (the file target defaults into the runtime dir)
    m_paths = RuntimePaths::from_environment();
    init_logging();

    spdlog::debug("[Application] Command: {}, runtime dir: {}", command_name(m_args.command),
                  m_paths.dir);

    // Phase 4: Dispatch
    switch (m_args.command) {
    case Command::DAEMON:
        return run_daemon();
    case Command::DAEMON_STOP:
        return run_daemon_stop();
    case Command::SCAN:
        return run_scan();
    case Command::OPEN_MENU:
        return run_menu();
    }
    return EXIT_FAILED;
}

// ============================================================================
// Initialization phases
// ============================================================================

bool Application::parse_args(int argc, char** argv) {
    if (!parse_cli_args(argc, argv, m_args)) {
        return false;
    }

    RuntimeConfig* runtime = get_runtime_config();
    runtime->test_mode = m_args.test_mode;
    runtime->use_real_wifi = m_args.use_real_wifi;
    return true;
}

bool Application::init_config() {
    m_config = std::make_unique<Config>();

    std::string path = Config::resolve_path(m_args.config_path, Config::executable_dir());
    try {
        m_config->load(path);
    } catch (const ConfigError& e) {
        fprintf(stderr, "wlmenu: %s\n", e.what());
        return false;
    }
    return true;
}

void Application::init_logging() {
    const Settings& settings = m_config->settings();

    logging::LogConfig log_config;
    log_config.level =
        logging::resolve_log_level(m_args.verbosity, settings.log_level, m_args.test_mode);
    log_config.enable_console = true;
    log_config.target = logging::parse_log_target(m_args.log_dest);
    log_config.file_path = m_args.log_file.empty() ? m_paths.log_file : m_args.log_file;
    logging::init(log_config);

    spdlog::info("[Application] wlmenu {} ({})", WLMENU_VERSION, command_name(m_args.command));
    if (m_config->get_path().empty()) {
        spdlog::debug("[Application] No config file, using defaults");
    } else {
        spdlog::info("[Application] Using config: {}", m_config->get_path());
    }
    if (get_runtime_config()->should_mock_wifi()) {
        spdlog::info("[Application] Test mode: using mock Wi-Fi backend");
    }
}

std::chrono::milliseconds Application::wait_timeout() const {
    std::chrono::seconds wait = m_config->settings().scan_timeout;
    if (m_args.timeout_sec > 0) {
        wait = std::chrono::seconds(m_args.timeout_sec);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(wait);
}

// ============================================================================
// Commands
// ============================================================================

int Application::run_daemon() {
    // Before any thread exists, so every thread inherits the mask
    SignalListener::block_signals();

    // A menu may hold the lock for one foreground cycle; let it finish
    DaemonLock lock(m_paths.lock_file);
    DaemonLock::Status status = lock.acquire_waiting(wait_timeout());
    if (status == DaemonLock::Status::ALREADY_RUNNING) {
        fprintf(stderr, "wlmenu: daemon already running (PID %d)\n",
                static_cast<int>(lock.holder_pid()));
        return EXIT_ALREADY_RUNNING;
    }
    if (status != DaemonLock::Status::ACQUIRED) {
        fprintf(stderr, "wlmenu: cannot lock %s: %s\n", m_paths.lock_file.c_str(),
                lock.error().c_str());
        return EXIT_FAILED;
    }
    if (lock.reclaimed_pid() > 0) {
        spdlog::info("[Application] Replaced stale lock of PID {}", lock.reclaimed_pid());
    }

    std::unique_ptr<WifiBackend> backend = WifiBackend::create();
    if (!backend) {
        spdlog::error("[Application] No Wi-Fi backend available, daemon cannot start");
        return EXIT_FAILED;
    }

    const Settings& settings = m_config->settings();
    StateCache cache(m_paths.cache_file);
    RefreshDaemon daemon(*backend, cache, settings.refresh_interval);

    SignalListener listener([&daemon]() { daemon.request_refresh(); },
                            [&daemon]() { daemon.request_stop(); });
    listener.start();

    spdlog::info("[Application] Daemon running (PID {}), interval {}s, cache {}", getpid(),
                 settings.refresh_interval.count(), m_paths.cache_file);
    uint64_t cycles = daemon.run();

    listener.stop();
    backend->stop();
    lock.release();

    spdlog::info("[Application] Daemon stopped after {} cycle(s) ({} failed)", cycles,
                 daemon.cycles_failed());
    return EXIT_OK;
}

int Application::run_scan() {
    StateCache cache(m_paths.cache_file);
    RefreshClient client(cache, m_paths.lock_file);

    RefreshClient::Outcome outcome = client.request_refresh(wait_timeout());
    switch (outcome) {
    case RefreshClient::Outcome::REFRESHED: {
        auto snapshot = cache.read();
        if (snapshot) {
            printf("%zu network(s), generation %llu\n", snapshot->networks.size(),
                   static_cast<unsigned long long>(snapshot->generation));
        }
        return EXIT_OK;
    }
    case RefreshClient::Outcome::DAEMON_NOT_RUNNING:
        fprintf(stderr, "wlmenu: daemon is not running\n");
        return EXIT_FAILED;
    case RefreshClient::Outcome::TIMED_OUT:
        fprintf(stderr, "wlmenu: no new scan result within %llds\n",
                static_cast<long long>(wait_timeout().count() / 1000));
        return EXIT_FAILED;
    default:
        fprintf(stderr, "wlmenu: refresh request failed (%s)\n",
                RefreshClient::outcome_name(outcome));
        return EXIT_FAILED;
    }
}

int Application::run_daemon_stop() {
    StateCache cache(m_paths.cache_file);
    RefreshClient client(cache, m_paths.lock_file);

    RefreshClient::Outcome outcome = client.stop_daemon(wait_timeout());
    switch (outcome) {
    case RefreshClient::Outcome::STOPPED:
        return EXIT_OK;
    case RefreshClient::Outcome::DAEMON_NOT_RUNNING:
        fprintf(stderr, "wlmenu: daemon is not running\n");
        return EXIT_FAILED;
    default:
        fprintf(stderr, "wlmenu: daemon did not stop (%s)\n",
                RefreshClient::outcome_name(outcome));
        return EXIT_FAILED;
    }
}

int Application::run_menu() {
    const Settings& settings = m_config->settings();

    // A refresh trigger aimed at a stale lock record must not kill the menu
    std::signal(SIGUSR1, SIG_IGN);
    DesktopNotifier notifier;

    if (!find_in_path("rofi")) {
        spdlog::error("[Application] rofi not found in PATH");
        notifier.send(Urgency::CRITICAL, "Error", "rofi is not installed");
        return EXIT_FAILED;
    }

    std::unique_ptr<WifiBackend> backend = WifiBackend::create();
    if (!backend) {
        notifier.send(Urgency::CRITICAL, "Error", "NetworkManager is not available");
        return EXIT_FAILED;
    }

    StateCache cache(m_paths.cache_file);
    RofiPresenter presenter(settings.menu);
    MenuController controller(*backend, presenter, notifier, cache, m_paths.lock_file, settings);

    int rc = controller.run();
    backend->stop();
    return rc;
}
