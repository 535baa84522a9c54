// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "vpn_trigger.h"

#include "../test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

TEST_CASE_METHOD(MockBackendFixture, "VpnTrigger: bound SSID starts its profile once", "[vpn]") {
    VpnTrigger vpn(backend, {{"HomeNet", "work-vpn"}});

    auto activation = vpn.activate_for("HomeNet");

    REQUIRE(activation.has_value());
    REQUIRE(activation->profile == "work-vpn");
    REQUIRE(activation->result.success());
    REQUIRE(backend.vpn_calls() == std::vector<std::string>{"work-vpn"});
}

TEST_CASE_METHOD(MockBackendFixture, "VpnTrigger: unbound SSIDs start nothing", "[vpn]") {
    VpnTrigger vpn(backend, {{"HomeNet", "work-vpn"}});

    REQUIRE_FALSE(vpn.activate_for("Cafe").has_value());
    REQUIRE_FALSE(vpn.activate_for("homenet").has_value());
    REQUIRE_FALSE(vpn.activate_for("").has_value());
    REQUIRE(backend.vpn_calls().empty());
}

TEST_CASE_METHOD(MockBackendFixture, "VpnTrigger: empty profile names count as unbound", "[vpn]") {
    VpnTrigger vpn(backend, {{"HomeNet", ""}});

    REQUIRE_FALSE(vpn.profile_for("HomeNet").has_value());
    REQUIRE_FALSE(vpn.activate_for("HomeNet").has_value());
    REQUIRE(backend.vpn_calls().empty());
}

TEST_CASE_METHOD(MockBackendFixture, "VpnTrigger: failure is reported, not rolled back", "[vpn]") {
    add_home_network();
    REQUIRE(backend.connect("HomeNet", std::string("correct-horse"), std::chrono::seconds(5))
                .success());
    backend.set_vpn_result(WiFiErrorHelper::backend_error("Unknown connection 'work-vpn'"));

    VpnTrigger vpn(backend, {{"HomeNet", "work-vpn"}});
    auto activation = vpn.activate_for("HomeNet");

    REQUIRE(activation.has_value());
    REQUIRE(activation->result.result == WiFiResult::BACKEND_ERROR);
    REQUIRE(backend.vpn_calls().size() == 1);
    REQUIRE(backend.connected_ssid() == "HomeNet");
}

TEST_CASE_METHOD(MockBackendFixture, "VpnTrigger: several bindings", "[vpn]") {
    VpnTrigger vpn(backend, {{"HomeNet", "work-vpn"}, {"Office", "corp-vpn"}});

    REQUIRE(vpn.bindings().size() == 2);
    REQUIRE(vpn.profile_for("Office") == std::optional<std::string>("corp-vpn"));

    vpn.activate_for("Office");
    vpn.activate_for("HomeNet");
    REQUIRE(backend.vpn_calls() == std::vector<std::string>{"corp-vpn", "work-vpn"});
}
