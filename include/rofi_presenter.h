// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "config.h"
#include "presenter.h"

#include <string>
#include <vector>

namespace wlmenu {

/**
 * @brief Presenter backed by `rofi -dmenu`
 *
 * Each dialog is one rofi run: rows go to stdin, the chosen row comes back on
 * stdout. A non-zero exit status (Escape, focus loss) is a dismissal.
 */
class RofiPresenter : public Presenter {
  public:
    explicit RofiPresenter(MenuSettings settings);

    std::optional<std::string> choose(const MenuRequest& request) override;
    bool confirm(const std::string& message) override;
    std::optional<std::string> prompt_secret(const std::string& hint) override;
    std::optional<std::string> prompt_text(const std::string& prompt) override;
    void show_info(const std::string& title, const std::vector<std::string>& lines) override;
    void show_qr(const std::string& title, const std::vector<std::string>& glyph_lines) override;

    /// Command line for @p request (without rows); exposed for tests
    std::vector<std::string> build_command(const MenuRequest& request, bool password) const;

  private:
    std::optional<std::string> run(const MenuRequest& request, bool password) const;

    MenuSettings settings_;
};

} // namespace wlmenu
