// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "runtime_paths.h"

#include <cstdlib>

namespace wlmenu {

RuntimePaths RuntimePaths::in_directory(const std::string& dir) {
    RuntimePaths p;
    p.dir = dir;
    while (p.dir.size() > 1 && p.dir.back() == '/') {
        p.dir.pop_back();
    }
    p.cache_file = p.dir + "/wlmenu-cache.json";
    p.lock_file = p.dir + "/wlmenu-daemon.lock";
    p.log_file = p.dir + "/wlmenu.log";
    return p;
}

RuntimePaths RuntimePaths::from_environment() {
    for (const char* var : {"WLMENU_RUNTIME_DIR", "XDG_RUNTIME_DIR"}) {
        const char* value = std::getenv(var);
        if (value && value[0] != '\0') {
            return in_directory(value);
        }
    }
    return in_directory("/tmp");
}

} // namespace wlmenu
