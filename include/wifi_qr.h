// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "wifi_types.h"

#include <string>
#include <vector>

namespace wlmenu {

/// Backslash-escape the characters the WIFI: URI reserves (\ ; , " :)
std::string escape_qr_field(const std::string& value);

/**
 * @brief Build the Wi-Fi join payload understood by phone cameras
 *
 * Format: `WIFI:T:<WPA|WEP|nopass>;S:<ssid>;P:<secret>;;`. The P field is
 * omitted for open networks.
 */
std::string build_wifi_qr_payload(const std::string& ssid, SecurityKind security,
                                  const std::string& secret);

/**
 * @brief Render @p payload as UTF-8 block glyphs with `qrencode -t UTF8`
 * @return One string per glyph row; empty when qrencode is unavailable or fails
 */
std::vector<std::string> render_qr_utf8(const std::string& payload);

} // namespace wlmenu
