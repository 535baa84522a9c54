// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_backend_mock.h"

#include "../test_fixtures.h"

#include <catch2/catch_test_macros.hpp>
#include <thread>

using namespace std::chrono_literals;

TEST_CASE("WifiBackendMock: calls before start are rejected", "[wifi][mock]") {
    WifiBackendMock backend;
    std::vector<NetworkRecord> networks;

    REQUIRE_FALSE(backend.is_running());
    REQUIRE(backend.scan(networks).result == WiFiResult::NOT_INITIALIZED);
    REQUIRE(backend.connect("HomeNet", std::nullopt, 5s).result == WiFiResult::NOT_INITIALIZED);

    REQUIRE(backend.start().success());
    REQUIRE(backend.is_running());
    backend.stop();
    REQUIRE_FALSE(backend.is_running());
}

TEST_CASE("WifiBackendMock: demo networks", "[wifi][mock]") {
    WifiBackendMock backend;
    REQUIRE(backend.start().success());
    backend.populate_demo_networks();

    std::vector<NetworkRecord> networks;
    REQUIRE(backend.scan(networks).success());
    REQUIRE(networks.size() == 6);

    bool saw_open = false;
    bool saw_enterprise = false;
    for (const auto& rec : networks) {
        REQUIRE(rec.signal_strength >= 0);
        REQUIRE(rec.signal_strength <= 100);
        saw_open |= rec.security == SecurityKind::OPEN;
        saw_enterprise |= rec.security == SecurityKind::ENTERPRISE;
        if (rec.ssid == "HomeNet") {
            REQUIRE(rec.saved);
        }
    }
    REQUIRE(saw_open);
    REQUIRE(saw_enterprise);
}

TEST_CASE_METHOD(MockBackendFixture, "WifiBackendMock: scan flags", "[wifi][mock]") {
    add_home_network();
    add_open_network();
    backend.add_saved_profile("HomeNet", "correct-horse");
    REQUIRE(backend.connect("HomeNet", std::nullopt, 5s).success());

    std::vector<NetworkRecord> networks;
    REQUIRE(backend.scan(networks).success());
    REQUIRE(networks.size() == 2);
    REQUIRE(networks[0].ssid == "HomeNet");
    REQUIRE(networks[0].saved);
    REQUIRE(networks[0].in_use);
    REQUIRE(networks[0].signal_strength == 82);
    REQUIRE_FALSE(networks[1].saved);
    REQUIRE_FALSE(networks[1].in_use);
    REQUIRE(backend.scan_count() == 1);
}

TEST_CASE_METHOD(MockBackendFixture, "WifiBackendMock: scan failures leave output untouched",
                 "[wifi][mock]") {
    add_home_network();
    std::vector<NetworkRecord> networks = {NetworkRecord()};

    SECTION("injected failure") {
        backend.set_scan_failure(true);
        REQUIRE(backend.scan(networks).result == WiFiResult::BACKEND_ERROR);
    }

    SECTION("radio off") {
        REQUIRE(backend.set_radio(false).success());
        REQUIRE(backend.scan(networks).result == WiFiResult::RF_KILL_BLOCKED);
    }

    REQUIRE(networks.size() == 1);
    REQUIRE(networks[0].ssid.empty());
}

TEST_CASE_METHOD(MockBackendFixture, "WifiBackendMock: connect keeps the profile on failure",
                 "[wifi][mock]") {
    add_home_network();

    WiFiError result = backend.connect("HomeNet", std::string("wrong"), 5s);
    REQUIRE(result.result == WiFiResult::AUTHENTICATION_FAILED);
    REQUIRE(backend.saved_profile_set().count("HomeNet") == 1);
    REQUIRE(backend.connected_ssid().empty());

    REQUIRE(backend.forget("HomeNet").success());
    REQUIRE(backend.saved_profile_set().empty());
    REQUIRE(backend.forget("HomeNet").result == WiFiResult::NETWORK_NOT_FOUND);
    REQUIRE(backend.forget_calls().size() == 2);
}

TEST_CASE_METHOD(MockBackendFixture, "WifiBackendMock: connect simulation", "[wifi][mock]") {
    add_home_network();
    add_open_network();

    SECTION("unknown network") {
        REQUIRE(backend.connect("Nowhere", std::nullopt, 5s).result ==
                WiFiResult::NETWORK_NOT_FOUND);
    }

    SECTION("secured network without secret or profile") {
        REQUIRE(backend.connect("HomeNet", std::nullopt, 5s).result ==
                WiFiResult::AUTHENTICATION_FAILED);
    }

    SECTION("open network saves a profile") {
        REQUIRE(backend.connect("Cafe", std::nullopt, 5s).success());
        REQUIRE(backend.connected_ssid() == "Cafe");
        REQUIRE(backend.saved_profile_set().count("Cafe") == 1);
    }

    SECTION("scripted results come first") {
        backend.script_connect_results({WiFiResult::TIMEOUT, WiFiResult::SUCCESS});
        REQUIRE(backend.connect("HomeNet", std::string("wrong"), 5s).result ==
                WiFiResult::TIMEOUT);
        REQUIRE(backend.connect("HomeNet", std::string("wrong"), 5s).success());
        REQUIRE(backend.connect_calls().size() == 2);
        REQUIRE(backend.connect_calls()[0].had_secret);
    }
}

TEST_CASE_METHOD(MockBackendFixture, "WifiBackendMock: cancel interrupts a slow connect",
                 "[wifi][mock]") {
    add_home_network();
    backend.set_connect_delay(5s);

    std::thread canceller([this]() {
        std::this_thread::sleep_for(50ms);
        backend.cancel();
    });
    WiFiError result = backend.connect("HomeNet", std::string("correct-horse"), 10s);
    canceller.join();

    REQUIRE(result.result == WiFiResult::CANCELLED);

    // Cancel stays raised until cleared
    std::vector<NetworkRecord> networks;
    backend.set_scan_delay(10ms);
    REQUIRE(backend.scan(networks).result == WiFiResult::CANCELLED);
    backend.clear_cancel();
    REQUIRE(backend.scan(networks).success());
}

TEST_CASE_METHOD(MockBackendFixture, "WifiBackendMock: details and ping need a connection",
                 "[wifi][mock]") {
    add_home_network();
    ConnectionDetails details;

    REQUIRE_FALSE(backend.connection_details("HomeNet", details).success());
    REQUIRE_FALSE(backend.ping("1.1.1.1", 1).has_value());

    REQUIRE(backend.connect("HomeNet", std::string("correct-horse"), 5s).success());
    REQUIRE(backend.connection_details("HomeNet", details).success());
    REQUIRE(details.ssid == "HomeNet");
    REQUIRE(details.ip_address == "192.168.1.150");
    REQUIRE(details.security == SecurityKind::WPA2);
    REQUIRE(details.latency_ms.has_value());

    backend.set_ping_latency(std::nullopt);
    REQUIRE_FALSE(backend.ping("1.1.1.1", 1).has_value());
}

TEST_CASE_METHOD(MockBackendFixture, "WifiBackendMock: radio off drops the connection",
                 "[wifi][mock]") {
    add_open_network();
    REQUIRE(backend.connect("Cafe", std::nullopt, 5s).success());

    REQUIRE(backend.set_radio(false).success());
    bool enabled = true;
    REQUIRE(backend.radio_enabled(enabled).success());
    REQUIRE_FALSE(enabled);
    REQUIRE(backend.connected_ssid().empty());

    std::string active = "stale";
    REQUIRE(backend.active_ssid(active).success());
    REQUIRE(active.empty());
}

TEST_CASE_METHOD(MockBackendFixture, "WifiBackendMock: saved secrets", "[wifi][mock]") {
    backend.add_saved_profile("HomeNet", "correct-horse");
    std::string secret;

    REQUIRE(backend.saved_secret("HomeNet", secret).success());
    REQUIRE(secret == "correct-horse");
    REQUIRE(backend.saved_secret("Other", secret).result == WiFiResult::NETWORK_NOT_FOUND);

    std::vector<std::string> names;
    REQUIRE(backend.saved_profiles(names).success());
    REQUIRE(names == std::vector<std::string>{"HomeNet"});
}
