// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "runtime_config.h"

namespace wlmenu {

RuntimeConfig* get_runtime_config() {
    static RuntimeConfig config;
    return &config;
}

} // namespace wlmenu
