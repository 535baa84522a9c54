// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace wlmenu {

enum class Urgency { LOW, NORMAL, CRITICAL };

/**
 * @brief Desktop notification sink
 */
class Notifier {
  public:
    virtual ~Notifier() = default;
    virtual void send(Urgency urgency, const std::string& title, const std::string& body) = 0;
};

/**
 * @brief notify-send based notifier
 *
 * Titles are prefixed with "Wi-Fi: ". Falls back to the log when notify-send
 * is missing or fails.
 */
class DesktopNotifier : public Notifier {
  public:
    DesktopNotifier();
    void send(Urgency urgency, const std::string& title, const std::string& body) override;

  private:
    bool available_;
};

const char* urgency_name(Urgency urgency);

} // namespace wlmenu
