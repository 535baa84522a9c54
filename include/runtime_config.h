// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

namespace wlmenu {

/**
 * @brief Runtime configuration for development and testing
 *
 * Controls whether the mock backend replaces NetworkManager.
 * In production mode (test_mode=false), NO mocks are ever used.
 * In test mode, mocks are used by default but can be overridden with --real-wifi.
 */
struct RuntimeConfig {
    bool test_mode = false;     ///< Master test mode flag (--test)
    bool use_real_wifi = false; ///< Use NetworkManager even in test mode (--real-wifi)

    /// True when the mock Wi-Fi backend should be used
    bool should_mock_wifi() const { return test_mode && !use_real_wifi; }
};

/// Process-wide runtime configuration
RuntimeConfig* get_runtime_config();

} // namespace wlmenu
