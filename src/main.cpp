// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "application.h"

int main(int argc, char** argv) {
    Application app;
    return app.run(argc, argv);
}
