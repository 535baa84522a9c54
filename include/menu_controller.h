// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "config.h"
#include "connection_orchestrator.h"
#include "notifier.h"
#include "presenter.h"
#include "state_cache.h"
#include "wifi_backend.h"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wlmenu {

/**
 * @brief The interactive menu loop
 *
 * Draws the main menu from the StateCache, dispatches the chosen action, and
 * keeps looping until the main menu is dismissed. Sub-flows return BACK when
 * nothing changed and REFRESH when network state changed, which requests a
 * fresh snapshot before the next draw.
 *
 * Fresh data comes from the daemon (trigger + wait) when one runs; otherwise
 * the controller runs one scan cycle itself while holding the daemon lock.
 */
class MenuController {
  public:
    enum class Nav { BACK, REFRESH, QUIT };

    enum class Action {
        TOGGLE_RADIO,
        REFRESH,
        MANUAL,
        DISCONNECT,
        FORGET,
        HOTSPOT,
        DETAILS,
        QR_CODE,
        CONNECT,
    };

    struct Entry {
        Action action;
        std::string label;
        std::string ssid; ///< CONNECT only
    };

    /// What one draw of the main menu shows
    struct MainMenu {
        MenuRequest request;
        std::vector<Entry> entries;
    };

    /// Everything the main menu is built from
    struct View {
        std::optional<CacheSnapshot> snapshot;
        bool radio_on = true;
        std::string active_ssid;
        int64_t now = 0;
        bool refresh_failed = false;
    };

    using WallClock = std::function<int64_t()>;

    MenuController(WifiBackend& backend, Presenter& presenter, Notifier& notifier,
                   StateCache& cache, std::string lock_path, const Settings& settings);

    /// Loop until the user dismisses the main menu
    int run();

    /**
     * @brief Draw the main menu once and handle the choice
     * @param force_refresh Get a fresh snapshot before drawing
     */
    Nav run_once(bool force_refresh);

    /**
     * @brief Get a new snapshot written
     *
     * Signals the daemon and waits for it, or performs one cycle under the
     * daemon lock when no daemon runs.
     *
     * @return true if a newer snapshot is now on disk
     */
    bool refresh();

    /// Connect through the orchestrator and report the outcome
    Nav connect_to(const std::string& ssid, SecurityKind security,
                   const std::optional<std::string>& secret);

    MainMenu build_main_menu(const View& view) const;

    void set_wall_clock(WallClock clock) { wall_clock_ = std::move(clock); }

    // Row formatting
    static std::string signal_bars(int signal);
    static std::string format_network_row(const NetworkRecord& record);
    static std::string format_age(int64_t seconds);

    /**
     * @brief Split manual input "SSID" or "SSID,password"
     *
     * Both parts are trimmed; an empty password counts as none.
     */
    static std::pair<std::string, std::optional<std::string>>
    parse_manual_entry(const std::string& input);

  private:
    Nav handle(const Entry& entry, const View& view);

    Nav toggle_radio();
    Nav manual_connect(const View& view);
    Nav disconnect(const std::string& ssid);
    Nav forget();
    Nav hotspot();
    Nav show_details(const std::string& ssid);
    Nav share_qr(const std::string& ssid, const View& view);

    void report_connected(const std::string& ssid);
    void report_outcome(const std::string& ssid, const ConnectionOrchestrator::Outcome& outcome);
    bool is_saved(const std::string& ssid);

    WifiBackend& backend_;
    Presenter& presenter_;
    Notifier& notifier_;
    StateCache& cache_;
    std::string lock_path_;
    const Settings& settings_;
    WallClock wall_clock_;
    bool last_refresh_failed_ = false;
};

} // namespace wlmenu
