// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_qr.h"

#include "process_runner.h"

#include <spdlog/spdlog.h>

#include <sstream>

namespace wlmenu {

std::string escape_qr_field(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '\\' || c == ';' || c == ',' || c == '"' || c == ':') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::string build_wifi_qr_payload(const std::string& ssid, SecurityKind security,
                                  const std::string& secret) {
    std::string type;
    switch (security) {
    case SecurityKind::OPEN:
        type = "nopass";
        break;
    case SecurityKind::WEP:
        type = "WEP";
        break;
    default:
        type = "WPA";
        break;
    }

    std::string payload = "WIFI:T:" + type + ";S:" + escape_qr_field(ssid) + ";";
    if (security != SecurityKind::OPEN) {
        payload += "P:" + escape_qr_field(secret) + ";";
    }
    payload += ";";
    return payload;
}

std::vector<std::string> render_qr_utf8(const std::string& payload) {
    std::vector<std::string> rows;

    ProcessOptions opts;
    opts.timeout = std::chrono::seconds(5);
    // Payload on stdin keeps the secret out of the process list
    opts.stdin_data = payload;

    ProcessResult res = run_process({"qrencode", "-t", "UTF8", "-m", "1"}, opts);
    if (!res.ok()) {
        if (res.spawn_failed) {
            spdlog::warn("[QR] qrencode not found");
        } else {
            spdlog::warn("[QR] qrencode failed: {}", res.last_error_line());
        }
        return rows;
    }

    std::istringstream stream(res.out);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty()) {
            rows.push_back(line);
        }
    }
    return rows;
}

} // namespace wlmenu
