// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "rofi_presenter.h"

#include "process_runner.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace wlmenu {

namespace {

// Interactive dialogs wait for the user, not for a deadline
constexpr auto DIALOG_TIMEOUT = std::chrono::hours(1);

const char* const CONFIRM_YES = "Yes";
const char* const CONFIRM_NO = "No";

std::string strip_newline(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

} // namespace

RofiPresenter::RofiPresenter(MenuSettings settings) : settings_(std::move(settings)) {}

std::vector<std::string> RofiPresenter::build_command(const MenuRequest& request,
                                                      bool password) const {
    std::vector<std::string> argv = {"rofi", "-dmenu", "-i", "-p", request.prompt};

    if (!settings_.font.empty()) {
        argv.insert(argv.end(), {"-font", settings_.font});
    }
    argv.insert(argv.end(), {"-location", std::to_string(settings_.location), "-xoffset",
                             std::to_string(settings_.x_offset), "-yoffset",
                             std::to_string(settings_.y_offset)});

    int lines = std::min<int>(settings_.max_lines, static_cast<int>(request.rows.size()));
    argv.insert(argv.end(), {"-l", std::to_string(std::max(lines, 0))});

    if (request.selected_row >= 0 &&
        request.selected_row < static_cast<int>(request.rows.size())) {
        argv.insert(argv.end(), {"-selected-row", std::to_string(request.selected_row)});
    }
    if (!request.message.empty()) {
        argv.insert(argv.end(), {"-mesg", request.message});
    }
    if (!request.allow_custom) {
        argv.push_back("-no-custom");
    }
    if (password) {
        argv.push_back("-password");
    }
    return argv;
}

std::optional<std::string> RofiPresenter::run(const MenuRequest& request, bool password) const {
    ProcessOptions opts;
    opts.timeout = DIALOG_TIMEOUT;
    for (const auto& row : request.rows) {
        opts.stdin_data += row;
        opts.stdin_data += '\n';
    }

    ProcessResult res = run_process(build_command(request, password), opts);
    if (res.spawn_failed) {
        spdlog::error("[Rofi] Failed to start rofi");
        return std::nullopt;
    }
    if (!res.ok()) {
        // Exit 1 is Escape; anything else is worth a trace
        if (res.exit_code != 1) {
            spdlog::debug("[Rofi] Dialog '{}' ended with status {}: {}", request.prompt,
                          res.exit_code, res.last_error_line());
        }
        return std::nullopt;
    }
    return strip_newline(res.out);
}

std::optional<std::string> RofiPresenter::choose(const MenuRequest& request) {
    auto choice = run(request, false);
    if (choice && choice->empty()) {
        return std::nullopt;
    }
    return choice;
}

bool RofiPresenter::confirm(const std::string& message) {
    MenuRequest req;
    req.prompt = "Confirm";
    req.message = message;
    req.rows = {CONFIRM_YES, CONFIRM_NO};
    auto choice = run(req, false);
    return choice && *choice == CONFIRM_YES;
}

std::optional<std::string> RofiPresenter::prompt_secret(const std::string& hint) {
    MenuRequest req;
    req.prompt = hint;
    req.allow_custom = true;
    return run(req, true);
}

std::optional<std::string> RofiPresenter::prompt_text(const std::string& prompt) {
    MenuRequest req;
    req.prompt = prompt;
    req.allow_custom = true;
    auto text = run(req, false);
    if (text && text->empty()) {
        return std::nullopt;
    }
    return text;
}

void RofiPresenter::show_info(const std::string& title, const std::vector<std::string>& lines) {
    MenuRequest req;
    req.prompt = title;
    req.rows = lines;
    (void)run(req, false);
}

void RofiPresenter::show_qr(const std::string& title, const std::vector<std::string>& glyph_lines) {
    // One row per glyph line; every line must be visible at once
    RofiPresenter qr_view(settings_);
    qr_view.settings_.max_lines = static_cast<int>(glyph_lines.size());
    qr_view.settings_.location = 0;
    qr_view.settings_.x_offset = 0;
    qr_view.settings_.y_offset = 0;

    MenuRequest req;
    req.prompt = title;
    req.rows = glyph_lines;
    (void)qr_view.run(req, false);
}

} // namespace wlmenu
