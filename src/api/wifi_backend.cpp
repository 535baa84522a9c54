// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_backend.h"

#include "runtime_config.h"
#include "wifi_backend_mock.h"
#include "wifi_backend_networkmanager.h"

#include <spdlog/spdlog.h>

namespace wlmenu {

const char* wifi_result_name(WiFiResult result) {
    switch (result) {
    case WiFiResult::SUCCESS:
        return "SUCCESS";
    case WiFiResult::PERMISSION_DENIED:
        return "PERMISSION_DENIED";
    case WiFiResult::SERVICE_NOT_RUNNING:
        return "SERVICE_NOT_RUNNING";
    case WiFiResult::HARDWARE_NOT_AVAILABLE:
        return "HARDWARE_NOT_AVAILABLE";
    case WiFiResult::RF_KILL_BLOCKED:
        return "RF_KILL_BLOCKED";
    case WiFiResult::CONNECTION_FAILED:
        return "CONNECTION_FAILED";
    case WiFiResult::TIMEOUT:
        return "TIMEOUT";
    case WiFiResult::AUTHENTICATION_FAILED:
        return "AUTHENTICATION_FAILED";
    case WiFiResult::NETWORK_NOT_FOUND:
        return "NETWORK_NOT_FOUND";
    case WiFiResult::INVALID_PARAMETERS:
        return "INVALID_PARAMETERS";
    case WiFiResult::CANCELLED:
        return "CANCELLED";
    case WiFiResult::BACKEND_ERROR:
        return "BACKEND_ERROR";
    case WiFiResult::NOT_INITIALIZED:
        return "NOT_INITIALIZED";
    }
    return "UNKNOWN";
}

std::unique_ptr<WifiBackend> WifiBackend::create() {
    // In test mode, always use mock unless --real-wifi was specified
    if (get_runtime_config()->should_mock_wifi()) {
        spdlog::debug("[WifiBackend] Test mode: using mock backend");
        auto mock = std::make_unique<WifiBackendMock>();
        mock->populate_demo_networks();
        mock->start();
        return mock;
    }

    auto nm_backend = std::make_unique<WifiBackendNetworkManager>();
    WiFiError nm_result = nm_backend->start();
    if (nm_result.success()) {
        spdlog::debug("[WifiBackend] NetworkManager backend started");
        return nm_backend;
    }

    spdlog::error("[WifiBackend] NetworkManager unavailable: {}", nm_result.technical_msg);
    return nullptr;
}

} // namespace wlmenu
