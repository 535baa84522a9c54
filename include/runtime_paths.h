// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace wlmenu {

/**
 * @brief Locations of the shared runtime files
 *
 * Directory: $WLMENU_RUNTIME_DIR, else $XDG_RUNTIME_DIR, else /tmp.
 */
struct RuntimePaths {
    std::string dir;
    std::string cache_file; ///< <dir>/wlmenu-cache.json
    std::string lock_file;  ///< <dir>/wlmenu-daemon.lock
    std::string log_file;   ///< <dir>/wlmenu.log, used by --log-dest=file without --log-file

    static RuntimePaths from_environment();
    static RuntimePaths in_directory(const std::string& dir);
};

} // namespace wlmenu
