// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "notifier.h"

#include "process_runner.h"

#include <spdlog/spdlog.h>

namespace wlmenu {

const char* urgency_name(Urgency urgency) {
    switch (urgency) {
    case Urgency::LOW:
        return "low";
    case Urgency::NORMAL:
        return "normal";
    case Urgency::CRITICAL:
        return "critical";
    }
    return "normal";
}

DesktopNotifier::DesktopNotifier() : available_(find_in_path("notify-send")) {
    if (!available_) {
        spdlog::debug("[Notify] notify-send not found, notifications go to the log");
    }
}

void DesktopNotifier::send(Urgency urgency, const std::string& title, const std::string& body) {
    std::string full_title = "Wi-Fi: " + title;

    if (available_) {
        ProcessOptions opts;
        opts.timeout = std::chrono::seconds(5);
        ProcessResult res =
            run_process({"notify-send", "-u", urgency_name(urgency), full_title, body}, opts);
        if (res.ok()) {
            return;
        }
        spdlog::debug("[Notify] notify-send failed: {}", res.last_error_line());
    }

    if (urgency == Urgency::CRITICAL) {
        spdlog::error("[Notify] {}: {}", full_title, body);
    } else {
        spdlog::info("[Notify] {}: {}", full_title, body);
    }
}

} // namespace wlmenu
