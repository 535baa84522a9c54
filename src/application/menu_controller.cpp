// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "menu_controller.h"

#include "daemon_lock.h"
#include "hotspot_manager.h"
#include "refresh_client.h"
#include "refresh_daemon.h"
#include "vpn_trigger.h"
#include "wifi_qr.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>

namespace wlmenu {

namespace {

// Row labels. Prefixes are unique so a row never matches a network name.
const char* const LABEL_RADIO_OFF = "⚡ Turn Wi-Fi off";
const char* const LABEL_RADIO_ON = "⚡ Turn Wi-Fi on";
const char* const LABEL_MANUAL = "✏️  Manual connect";
const char* const LABEL_DISCONNECT = "❌ Disconnect";
const char* const LABEL_FORGET = "🗑️  Forget a network";
const char* const LABEL_HOTSPOT = "📡 Hotspot";
const char* const LABEL_DETAILS = "📊 Details";
const char* const LABEL_QR = "📷 Share as QR code";

const char* const WARN_OPEN = "⚠ Open (unencrypted) networks nearby, connect with care";

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

MenuController::MenuController(WifiBackend& backend, Presenter& presenter, Notifier& notifier,
                               StateCache& cache, std::string lock_path, const Settings& settings)
    : backend_(backend), presenter_(presenter), notifier_(notifier), cache_(cache),
      lock_path_(std::move(lock_path)), settings_(settings),
      wall_clock_([]() { return static_cast<int64_t>(std::time(nullptr)); }) {}

// ============================================================================
// Formatting
// ============================================================================

std::string MenuController::signal_bars(int signal) {
    if (signal >= 75)
        return "▂▄▆█";
    if (signal >= 50)
        return "▂▄▆_";
    if (signal >= 25)
        return "▂▄__";
    if (signal > 0)
        return "▂___";
    return "____";
}

std::string MenuController::format_network_row(const NetworkRecord& record) {
    const char* active = record.in_use ? "● " : "  ";
    const char* lock;
    switch (record.security) {
    case SecurityKind::OPEN:
        lock = "   ";
        break;
    case SecurityKind::WEP:
        lock = "🔓 ";
        break;
    default:
        lock = "🔒 ";
        break;
    }
    return fmt::format("{}{}{:<20}  {}  {:>3}%", active, lock, record.ssid,
                       signal_bars(record.signal_strength), record.signal_strength);
}

std::string MenuController::format_age(int64_t seconds) {
    if (seconds < 0) {
        seconds = 0;
    }
    if (seconds < 60) {
        return std::to_string(seconds) + "s";
    }
    if (seconds < 3600) {
        return std::to_string(seconds / 60) + "m";
    }
    return std::to_string(seconds / 3600) + "h";
}

std::pair<std::string, std::optional<std::string>>
MenuController::parse_manual_entry(const std::string& input) {
    size_t comma = input.find(',');
    if (comma == std::string::npos) {
        return {trim(input), std::nullopt};
    }
    std::string ssid = trim(input.substr(0, comma));
    std::string pass = trim(input.substr(comma + 1));
    if (pass.empty()) {
        return {ssid, std::nullopt};
    }
    return {ssid, pass};
}

MenuController::MainMenu MenuController::build_main_menu(const View& view) const {
    MainMenu menu;
    menu.request.prompt = "📶 Wi-Fi";

    auto add = [&menu](Action action, std::string label, std::string ssid = "") {
        menu.entries.push_back(Entry{action, std::move(label), std::move(ssid)});
    };

    add(Action::TOGGLE_RADIO, view.radio_on ? LABEL_RADIO_OFF : LABEL_RADIO_ON);
    if (view.snapshot) {
        add(Action::REFRESH, "🔄 Refresh  (updated " +
                                 format_age(view.now - view.snapshot->scan_timestamp) + " ago)");
    } else {
        add(Action::REFRESH, "🔄 Refresh  (no data yet)");
    }
    add(Action::MANUAL, LABEL_MANUAL);

    const bool connected = !view.active_ssid.empty();
    if (connected) {
        add(Action::DISCONNECT, LABEL_DISCONNECT);
    }
    add(Action::FORGET, LABEL_FORGET);
    add(Action::HOTSPOT, LABEL_HOTSPOT);
    if (connected) {
        add(Action::DETAILS, LABEL_DETAILS);
        add(Action::QR_CODE, LABEL_QR);
    }

    std::vector<std::string> notes;
    if (!view.radio_on) {
        notes.push_back("Wi-Fi is off");
    } else if (view.snapshot) {
        bool any_open = false;
        for (const auto& net : view.snapshot->networks) {
            if (!connected && net.in_use) {
                // The snapshot predates a disconnect; do not claim it is active
                NetworkRecord shown = net;
                shown.in_use = false;
                add(Action::CONNECT, format_network_row(shown), net.ssid);
            } else {
                add(Action::CONNECT, format_network_row(net), net.ssid);
            }
            if (view.active_ssid == net.ssid) {
                menu.request.selected_row = static_cast<int>(menu.entries.size()) - 1;
            }
            any_open = any_open || net.security == SecurityKind::OPEN;
        }
        if (any_open) {
            notes.push_back(WARN_OPEN);
        }
        if (StateCache::is_stale(*view.snapshot, view.now, settings_.refresh_interval,
                                 settings_.stale_after_intervals)) {
            notes.push_back("⚠ Network list is " +
                            format_age(view.now - view.snapshot->scan_timestamp) +
                            " old, is the refresh daemon running?");
        }
    }
    if (view.refresh_failed) {
        notes.push_back("⚠ Scan failed, showing the last known networks");
    }

    for (size_t i = 0; i < notes.size(); i++) {
        if (i > 0) {
            menu.request.message += "\n";
        }
        menu.request.message += notes[i];
    }

    for (const auto& entry : menu.entries) {
        menu.request.rows.push_back(entry.label);
    }
    return menu;
}

// ============================================================================
// Main loop
// ============================================================================

int MenuController::run() {
    bool force = false;
    for (;;) {
        Nav nav = run_once(force);
        if (nav == Nav::QUIT) {
            spdlog::debug("[Menu] Main menu dismissed");
            return 0;
        }
        force = (nav == Nav::REFRESH);
    }
}

MenuController::Nav MenuController::run_once(bool force_refresh) {
    View view;
    view.snapshot = cache_.read();

    if (force_refresh || !view.snapshot) {
        if (!view.snapshot) {
            notifier_.send(Urgency::LOW, "Scanning", "Searching for nearby networks");
        }
        last_refresh_failed_ = !refresh();
        view.snapshot = cache_.read();
    }
    view.refresh_failed = last_refresh_failed_;

    WiFiError radio = backend_.radio_enabled(view.radio_on);
    if (!radio.success()) {
        spdlog::debug("[Menu] Radio state unknown: {}", radio.technical_msg);
        view.radio_on = true;
    }
    WiFiError active = backend_.active_ssid(view.active_ssid);
    if (!active.success()) {
        spdlog::debug("[Menu] Active network unknown: {}", active.technical_msg);
        view.active_ssid.clear();
    }
    view.now = wall_clock_();

    MainMenu menu = build_main_menu(view);
    auto choice = presenter_.choose(menu.request);
    if (!choice) {
        return Nav::QUIT;
    }

    for (const auto& entry : menu.entries) {
        if (entry.label == *choice) {
            return handle(entry, view);
        }
    }
    spdlog::debug("[Menu] Unrecognized choice '{}'", *choice);
    return Nav::BACK;
}

bool MenuController::refresh() {
    const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(settings_.scan_timeout);
    RefreshClient client(cache_, lock_path_);

    if (client.daemon_pid() != 0) {
        RefreshClient::Outcome outcome = client.request_refresh(wait);
        spdlog::debug("[Menu] Daemon refresh: {}", RefreshClient::outcome_name(outcome));
        return outcome == RefreshClient::Outcome::REFRESHED;
    }

    // No daemon: become the single writer for one cycle. The one-shot role
    // keeps clients from signalling us as if we were the daemon.
    DaemonLock lock(lock_path_, DaemonLock::Role::ONESHOT);
    DaemonLock::Status status = lock.acquire();
    if (status == DaemonLock::Status::ALREADY_RUNNING) {
        // A daemon started in between; its first cycle publishes a new generation
        return client.wait_for_generation(cache_.current_generation(), wait);
    }
    if (status != DaemonLock::Status::ACQUIRED) {
        spdlog::warn("[Menu] Cannot take the daemon lock: {}", lock.error());
        return false;
    }

    RefreshDaemon one_shot(backend_, cache_, settings_.refresh_interval);
    one_shot.set_wall_clock(wall_clock_);
    bool written = one_shot.run_cycle();
    lock.release();
    return written;
}

MenuController::Nav MenuController::handle(const Entry& entry, const View& view) {
    switch (entry.action) {
    case Action::TOGGLE_RADIO:
        return toggle_radio();
    case Action::REFRESH:
        return Nav::REFRESH;
    case Action::MANUAL:
        return manual_connect(view);
    case Action::DISCONNECT:
        return disconnect(view.active_ssid);
    case Action::FORGET:
        return forget();
    case Action::HOTSPOT:
        return hotspot();
    case Action::DETAILS:
        return show_details(view.active_ssid);
    case Action::QR_CODE:
        return share_qr(view.active_ssid, view);
    case Action::CONNECT: {
        SecurityKind security = SecurityKind::UNKNOWN;
        if (view.snapshot) {
            if (const NetworkRecord* rec = view.snapshot->find(entry.ssid)) {
                security = rec->security;
            }
        }
        return connect_to(entry.ssid, security, std::nullopt);
    }
    }
    return Nav::BACK;
}

// ============================================================================
// Actions
// ============================================================================

MenuController::Nav MenuController::toggle_radio() {
    bool enabled = true;
    WiFiError state = backend_.radio_enabled(enabled);
    if (!state.success()) {
        notifier_.send(Urgency::CRITICAL, "Radio", state.user_msg);
        return Nav::BACK;
    }

    WiFiError result = backend_.set_radio(!enabled);
    if (!result.success()) {
        notifier_.send(Urgency::CRITICAL, "Radio", result.user_msg);
        return Nav::BACK;
    }
    notifier_.send(Urgency::NORMAL, "Radio", enabled ? "Wi-Fi turned off" : "Wi-Fi turned on");
    return Nav::REFRESH;
}

MenuController::Nav MenuController::manual_connect(const View& view) {
    auto input = presenter_.prompt_text("Connect to (SSID or SSID,password)");
    if (!input) {
        return Nav::BACK;
    }

    auto [ssid, secret] = parse_manual_entry(*input);
    if (ssid.empty()) {
        notifier_.send(Urgency::CRITICAL, "Error", "Network name cannot be empty");
        return Nav::BACK;
    }

    SecurityKind security = secret ? SecurityKind::WPA2 : SecurityKind::OPEN;
    if (view.snapshot) {
        if (const NetworkRecord* rec = view.snapshot->find(ssid)) {
            security = rec->security;
        }
    }
    return connect_to(ssid, security, secret);
}

MenuController::Nav MenuController::disconnect(const std::string& ssid) {
    if (ssid.empty()) {
        notifier_.send(Urgency::LOW, "Disconnect", "Not connected to any network");
        return Nav::BACK;
    }
    if (!presenter_.confirm("Disconnect from '" + ssid + "'?")) {
        return Nav::BACK;
    }

    WiFiError result = backend_.disconnect(ssid);
    if (!result.success()) {
        notifier_.send(Urgency::CRITICAL, "Disconnect failed", result.user_msg);
        return Nav::BACK;
    }
    notifier_.send(Urgency::NORMAL, "Disconnected", ssid);
    return Nav::REFRESH;
}

MenuController::Nav MenuController::forget() {
    std::vector<std::string> saved;
    WiFiError listed = backend_.saved_profiles(saved);
    if (!listed.success()) {
        notifier_.send(Urgency::CRITICAL, "Forget", listed.user_msg);
        return Nav::BACK;
    }
    if (saved.empty()) {
        notifier_.send(Urgency::LOW, "Forget", "No saved Wi-Fi networks");
        return Nav::BACK;
    }

    MenuRequest req;
    req.prompt = "🗑 Forget which network?";
    req.rows = saved;
    auto name = presenter_.choose(req);
    if (!name) {
        return Nav::BACK;
    }
    if (!presenter_.confirm("Permanently delete '" + *name + "'?")) {
        return Nav::BACK;
    }

    WiFiError result = backend_.forget(*name);
    if (!result.success()) {
        notifier_.send(Urgency::CRITICAL, "Forget failed", result.user_msg);
        return Nav::BACK;
    }
    notifier_.send(Urgency::NORMAL, "Forgotten", *name);
    return Nav::REFRESH;
}

MenuController::Nav MenuController::hotspot() {
    HotspotManager manager(backend_);
    WiFiError status = manager.refresh();
    if (!status.success()) {
        notifier_.send(Urgency::CRITICAL, "Hotspot", status.user_msg);
        return Nav::BACK;
    }

    if (manager.state() == HotspotManager::State::ON) {
        if (!presenter_.confirm("Stop hotspot '" + manager.active_profile() + "'?")) {
            return Nav::BACK;
        }
        WiFiError off = manager.turn_off();
        if (!off.success()) {
            notifier_.send(Urgency::CRITICAL, "Hotspot", off.user_msg);
            return Nav::BACK;
        }
        notifier_.send(Urgency::NORMAL, "Hotspot stopped", "");
        return Nav::REFRESH;
    }

    // Reuse the stored hotspot profile when there is one
    WiFiError on = manager.turn_on();
    if (on.result == WiFiResult::NETWORK_NOT_FOUND) {
        auto name = presenter_.prompt_text("📡 Hotspot name");
        if (!name) {
            return Nav::BACK;
        }
        auto pass = presenter_.prompt_secret("Hotspot password (8-63 characters)");
        if (!pass) {
            return Nav::BACK;
        }
        on = manager.turn_on(*name, *pass);
    }

    if (!on.success()) {
        notifier_.send(Urgency::CRITICAL, "Hotspot failed", on.user_msg);
        return Nav::BACK;
    }
    notifier_.send(Urgency::NORMAL, "Hotspot started", manager.active_profile());
    return Nav::REFRESH;
}

MenuController::Nav MenuController::show_details(const std::string& ssid) {
    if (ssid.empty()) {
        notifier_.send(Urgency::LOW, "Details", "Not connected to any network");
        return Nav::BACK;
    }

    ConnectionDetails d;
    WiFiError result = backend_.connection_details(ssid, d);
    if (!result.success()) {
        notifier_.send(Urgency::CRITICAL, "Details", result.user_msg);
        return Nav::BACK;
    }
    if (!d.latency_ms) {
        d.latency_ms = backend_.ping(settings_.ping_host, 1);
    }

    std::string dns;
    for (const auto& server : d.dns) {
        if (!dns.empty()) {
            dns += ", ";
        }
        dns += server;
    }

    std::vector<std::string> lines = {
        "SSID     : " + d.ssid,
        "IP       : " + (d.ip_address.empty() ? std::string("-") : d.ip_address),
        "Gateway  : " + (d.gateway.empty() ? std::string("-") : d.gateway),
        "DNS      : " + (dns.empty() ? std::string("-") : dns),
        std::string("Security : ") + security_name(d.security),
        "Signal   : " + std::to_string(d.signal_strength) + "%",
        "Latency  : " + (d.latency_ms ? fmt::format("{:.1f} ms", *d.latency_ms)
                                      : std::string("timeout")),
    };
    presenter_.show_info("📊 " + ssid, lines);
    return Nav::BACK;
}

MenuController::Nav MenuController::share_qr(const std::string& ssid, const View& view) {
    if (ssid.empty()) {
        notifier_.send(Urgency::LOW, "QR code", "Not connected to any network");
        return Nav::BACK;
    }

    SecurityKind security = SecurityKind::WPA2;
    if (view.snapshot) {
        if (const NetworkRecord* rec = view.snapshot->find(ssid)) {
            security = rec->security;
        }
    }

    std::string secret;
    if (needs_secret(security)) {
        WiFiError result = backend_.saved_secret(ssid, secret);
        if (!result.success()) {
            notifier_.send(Urgency::CRITICAL, "QR code", "No saved password for " + ssid);
            return Nav::BACK;
        }
    }

    std::vector<std::string> glyphs = render_qr_utf8(build_wifi_qr_payload(ssid, security, secret));
    if (glyphs.empty()) {
        notifier_.send(Urgency::CRITICAL, "QR code", "Could not render the QR code (qrencode)");
        return Nav::BACK;
    }
    presenter_.show_qr("📷 " + ssid, glyphs);
    return Nav::BACK;
}

// ============================================================================
// Connecting
// ============================================================================

bool MenuController::is_saved(const std::string& ssid) {
    std::vector<std::string> saved;
    WiFiError result = backend_.saved_profiles(saved);
    if (!result.success()) {
        spdlog::debug("[Menu] Saved profiles unavailable: {}", result.technical_msg);
        return false;
    }
    return std::find(saved.begin(), saved.end(), ssid) != saved.end();
}

MenuController::Nav MenuController::connect_to(const std::string& ssid, SecurityKind security,
                                               const std::optional<std::string>& secret) {
    VpnTrigger vpn(backend_, settings_.vpn_bindings);

    ConnectionOrchestrator::Options options;
    options.max_attempts = settings_.max_retry;
    options.connect_timeout = settings_.connect_timeout;
    options.warn_open_networks = settings_.warn_open_networks;
    ConnectionOrchestrator orchestrator(backend_, presenter_, vpn, options);

    orchestrator.set_state_callback([this, &ssid](ConnectionOrchestrator::State,
                                                  ConnectionOrchestrator::State to) {
        if (to == ConnectionOrchestrator::State::CONNECTING) {
            notifier_.send(Urgency::LOW, "Connecting", ssid);
        }
    });

    ConnectionOrchestrator::Request request;
    request.ssid = ssid;
    request.security = security;
    request.secret = secret;
    request.has_saved_profile = !secret && is_saved(ssid);

    ConnectionOrchestrator::Outcome outcome = orchestrator.connect(request);
    report_outcome(ssid, outcome);

    // A declined open-network question changed nothing
    if (outcome.error == ConnectionOrchestrator::ErrorKind::USER_CANCELLED &&
        outcome.attempts == 0) {
        return Nav::BACK;
    }
    return Nav::REFRESH;
}

void MenuController::report_connected(const std::string& ssid) {
    std::string ip;
    ConnectionDetails details;
    if (backend_.connection_details(ssid, details).success()) {
        ip = details.ip_address;
    }

    std::optional<double> latency = backend_.ping(settings_.ping_host, settings_.ping_count);
    std::string net_status = latency ? fmt::format("✓ Internet reachable ({:.0f} ms)", *latency)
                                     : std::string("⚠ Connected but no internet access");

    notifier_.send(Urgency::NORMAL, "Connected ✓",
                   ssid + "\nIP: " + (ip.empty() ? std::string("unknown") : ip) + "\n" +
                       net_status);
}

void MenuController::report_outcome(const std::string& ssid,
                                    const ConnectionOrchestrator::Outcome& outcome) {
    using ErrorKind = ConnectionOrchestrator::ErrorKind;

    if (outcome.connected()) {
        report_connected(ssid);
        if (outcome.vpn) {
            if (outcome.vpn->result.success()) {
                notifier_.send(Urgency::NORMAL, "VPN connected", outcome.vpn->profile);
            } else {
                notifier_.send(Urgency::CRITICAL, "VPN failed",
                               "Could not start " + outcome.vpn->profile + ": " +
                                   outcome.vpn->result.user_msg);
            }
        }
        return;
    }

    switch (outcome.error) {
    case ErrorKind::USER_CANCELLED:
        notifier_.send(Urgency::LOW, "Cancelled", "Gave up connecting to " + ssid);
        break;
    case ErrorKind::TIMEOUT:
        notifier_.send(Urgency::CRITICAL, "Connection timed out",
                       outcome.reason + "\nCheck the signal strength of " + ssid);
        break;
    case ErrorKind::AUTH_FAILURE:
        notifier_.send(Urgency::CRITICAL, "Wrong password",
                       "Rejected " + std::to_string(outcome.auth_failures) +
                           " time(s): " + outcome.reason);
        break;
    default:
        notifier_.send(Urgency::CRITICAL, "Connection failed", outcome.reason);
        break;
    }
}

} // namespace wlmenu
