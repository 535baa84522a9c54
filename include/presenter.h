// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace wlmenu {

/**
 * @brief One menu invocation
 */
struct MenuRequest {
    std::string prompt;
    std::vector<std::string> rows;
    int selected_row = -1; ///< Pre-selected row, -1 for none
    std::string message;   ///< Line shown above the rows (warnings, hints)
    bool allow_custom = false;
};

/**
 * @brief Interactive front end
 *
 * Every dialog may be dismissed by the user; that is reported as nullopt (or
 * false for confirm()) and treated as a cancellation by callers.
 */
class Presenter {
  public:
    virtual ~Presenter() = default;

    /// Pick a row; returns the row text (or free text when allow_custom)
    virtual std::optional<std::string> choose(const MenuRequest& request) = 0;

    /// Yes/no question
    virtual bool confirm(const std::string& message) = 0;

    /// Non-echoing input for a passphrase
    virtual std::optional<std::string> prompt_secret(const std::string& hint) = 0;

    /// Free text input
    virtual std::optional<std::string> prompt_text(const std::string& prompt) = 0;

    /// Read-only list of lines (details view)
    virtual void show_info(const std::string& title, const std::vector<std::string>& lines) = 0;

    /// Pre-rendered QR glyph lines
    virtual void show_qr(const std::string& title, const std::vector<std::string>& glyph_lines) = 0;
};

} // namespace wlmenu
