// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "connection_orchestrator.h"

#include "../test_fixtures.h"

#include <catch2/catch_test_macros.hpp>
#include <thread>

using namespace std::chrono_literals;

using State = ConnectionOrchestrator::State;
using ErrorKind = ConnectionOrchestrator::ErrorKind;

class OrchestratorFixture : public MockBackendFixture {
  protected:
    VpnTrigger::Bindings bindings;
    ConnectionOrchestrator::Options options;

    OrchestratorFixture() {
        add_home_network();
        add_open_network();
        options.max_attempts = 3;
        options.connect_timeout = 5s;
    }

    ConnectionOrchestrator::Request secured_request() const {
        ConnectionOrchestrator::Request req;
        req.ssid = "HomeNet";
        req.security = SecurityKind::WPA2;
        return req;
    }

    ConnectionOrchestrator::Request open_request() const {
        ConnectionOrchestrator::Request req;
        req.ssid = "Cafe";
        req.security = SecurityKind::OPEN;
        return req;
    }
};

// ============================================================================
// Credential retry
// ============================================================================

TEST_CASE_METHOD(OrchestratorFixture, "Orchestrator: correct password connects first time",
                 "[connect]") {
    VpnTrigger vpn(backend, bindings);
    ConnectionOrchestrator orch(backend, presenter, vpn, options);
    presenter.secrets.push_back(std::string("correct-horse"));

    auto outcome = orch.connect(secured_request());

    REQUIRE(outcome.connected());
    REQUIRE(outcome.attempts == 1);
    REQUIRE(outcome.auth_failures == 0);
    REQUIRE(backend.connected_ssid() == "HomeNet");
    REQUIRE(backend.saved_profile_set().count("HomeNet") == 1);
    REQUIRE(presenter.secret_hints.size() == 1);

    auto history = orch.transitions();
    REQUIRE(history.size() == 3);
    REQUIRE(history[0] == std::make_pair(State::IDLE, State::PASSWORD_REQUIRED));
    REQUIRE(history[1] == std::make_pair(State::PASSWORD_REQUIRED, State::CONNECTING));
    REQUIRE(history[2] == std::make_pair(State::CONNECTING, State::CONNECTED));
    REQUIRE(orch.state() == State::CONNECTED);
}

TEST_CASE_METHOD(OrchestratorFixture, "Orchestrator: wrong passwords stop after the retry limit",
                 "[connect][retry]") {
    VpnTrigger vpn(backend, bindings);
    ConnectionOrchestrator orch(backend, presenter, vpn, options);

    presenter.secrets = {std::string("bad-1"), std::string("bad-2"), std::string("bad-3"),
                         std::string("never-asked")};

    // Every retry prompt must find the failed profile already gone
    std::vector<bool> profile_present_at_prompt;
    presenter.on_prompt_secret = [&]() {
        profile_present_at_prompt.push_back(backend.saved_profile_set().count("HomeNet") > 0);
    };

    auto outcome = orch.connect(secured_request());

    REQUIRE_FALSE(outcome.connected());
    REQUIRE(outcome.error == ErrorKind::AUTH_FAILURE);
    REQUIRE(outcome.attempts == 3);
    REQUIRE(outcome.auth_failures == 3);
    REQUIRE(backend.connect_calls().size() == 3);
    REQUIRE(backend.forget_calls().size() == 3);
    REQUIRE(backend.saved_profile_set().count("HomeNet") == 0);
    REQUIRE(backend.connected_ssid().empty());

    // Initial prompt plus two retries; the fourth answer is never used
    REQUIRE(presenter.secret_hints.size() == 3);
    REQUIRE(presenter.secrets.size() == 1);
    REQUIRE(profile_present_at_prompt == std::vector<bool>{false, false, false});
    REQUIRE(presenter.secret_hints[1].find("1/3") != std::string::npos);
}

TEST_CASE_METHOD(OrchestratorFixture, "Orchestrator: retry with the right password succeeds",
                 "[connect][retry]") {
    VpnTrigger vpn(backend, bindings);
    ConnectionOrchestrator orch(backend, presenter, vpn, options);
    presenter.secrets = {std::string("typo"), std::string("correct-horse")};

    auto outcome = orch.connect(secured_request());

    REQUIRE(outcome.connected());
    REQUIRE(outcome.attempts == 2);
    REQUIRE(outcome.auth_failures == 1);
    REQUIRE(backend.saved_profile_set().count("HomeNet") == 1);

    bool saw_retry = false;
    for (const auto& t : orch.transitions()) {
        if (t.second == State::RETRYING) {
            saw_retry = true;
        }
    }
    REQUIRE(saw_retry);
}

TEST_CASE_METHOD(OrchestratorFixture, "Orchestrator: max_attempts below one means one attempt",
                 "[connect][retry]") {
    options.max_attempts = 0;
    VpnTrigger vpn(backend, bindings);
    ConnectionOrchestrator orch(backend, presenter, vpn, options);
    presenter.secrets = {std::string("bad"), std::string("correct-horse")};

    auto outcome = orch.connect(secured_request());

    REQUIRE(outcome.error == ErrorKind::AUTH_FAILURE);
    REQUIRE(outcome.attempts == 1);
}

TEST_CASE_METHOD(OrchestratorFixture, "Orchestrator: dismissing the retry prompt cancels",
                 "[connect][retry]") {
    VpnTrigger vpn(backend, bindings);
    ConnectionOrchestrator orch(backend, presenter, vpn, options);
    presenter.secrets = {std::string("bad")};

    auto outcome = orch.connect(secured_request());

    REQUIRE(outcome.error == ErrorKind::USER_CANCELLED);
    REQUIRE(outcome.attempts == 1);
    REQUIRE(outcome.auth_failures == 1);
    REQUIRE(backend.saved_profile_set().count("HomeNet") == 0);
}

// ============================================================================
// Non-credential failures
// ============================================================================

TEST_CASE_METHOD(OrchestratorFixture, "Orchestrator: timeout fails without consuming retries",
                 "[connect]") {
    VpnTrigger vpn(backend, bindings);
    ConnectionOrchestrator orch(backend, presenter, vpn, options);
    backend.script_connect_results({WiFiResult::TIMEOUT});

    auto req = secured_request();
    req.secret = "correct-horse";
    auto outcome = orch.connect(req);

    REQUIRE(outcome.error == ErrorKind::TIMEOUT);
    REQUIRE(outcome.attempts == 1);
    REQUIRE(outcome.auth_failures == 0);
    REQUIRE(presenter.secret_hints.empty());
    REQUIRE(backend.saved_profile_set().count("HomeNet") == 0);
    REQUIRE(orch.last_attempt().last_error == ErrorKind::TIMEOUT);
}

TEST_CASE_METHOD(OrchestratorFixture, "Orchestrator: adapter errors fail immediately",
                 "[connect]") {
    VpnTrigger vpn(backend, bindings);
    ConnectionOrchestrator orch(backend, presenter, vpn, options);
    backend.script_connect_results({WiFiResult::CONNECTION_FAILED});

    auto req = secured_request();
    req.secret = "correct-horse";
    auto outcome = orch.connect(req);

    REQUIRE(outcome.error == ErrorKind::ADAPTER_ERROR);
    REQUIRE(outcome.attempts == 1);
    REQUIRE_FALSE(outcome.reason.empty());
    REQUIRE(backend.connect_calls().size() == 1);
}

TEST_CASE_METHOD(OrchestratorFixture, "Orchestrator: empty SSID is rejected", "[connect]") {
    VpnTrigger vpn(backend, bindings);
    ConnectionOrchestrator orch(backend, presenter, vpn, options);

    ConnectionOrchestrator::Request req;
    auto outcome = orch.connect(req);

    REQUIRE(outcome.error == ErrorKind::ADAPTER_ERROR);
    REQUIRE(backend.connect_calls().empty());
}

// ============================================================================
// Saved profiles
// ============================================================================

TEST_CASE_METHOD(OrchestratorFixture, "Orchestrator: saved profile connects without a prompt",
                 "[connect][saved]") {
    backend.add_saved_profile("HomeNet", "correct-horse");
    VpnTrigger vpn(backend, bindings);
    ConnectionOrchestrator orch(backend, presenter, vpn, options);

    auto req = secured_request();
    req.has_saved_profile = true;
    auto outcome = orch.connect(req);

    REQUIRE(outcome.connected());
    REQUIRE(presenter.secret_hints.empty());
    REQUIRE(backend.connect_calls().size() == 1);
    REQUIRE_FALSE(backend.connect_calls()[0].had_secret);
}

TEST_CASE_METHOD(OrchestratorFixture, "Orchestrator: failing saved profile is not deleted",
                 "[connect][saved]") {
    backend.add_saved_profile("HomeNet", "outdated");
    VpnTrigger vpn(backend, bindings);
    ConnectionOrchestrator orch(backend, presenter, vpn, options);

    auto req = secured_request();
    req.has_saved_profile = true;

    SECTION("timeout") {
        backend.script_connect_results({WiFiResult::TIMEOUT});
        auto outcome = orch.connect(req);
        REQUIRE(outcome.error == ErrorKind::TIMEOUT);
        REQUIRE(backend.forget_calls().empty());
        REQUIRE(backend.saved_profile_set().count("HomeNet") == 1);
    }

    SECTION("credential rejected, user gives up") {
        auto outcome = orch.connect(req);
        REQUIRE(outcome.error == ErrorKind::USER_CANCELLED);
        REQUIRE(outcome.auth_failures == 1);
        REQUIRE(backend.forget_calls().empty());
        REQUIRE(backend.saved_profile_set().count("HomeNet") == 1);
    }

    SECTION("credential rejected, new password also wrong") {
        presenter.secrets = {std::string("still-wrong"), std::string("wrong-again")};
        auto outcome = orch.connect(req);
        REQUIRE(outcome.error == ErrorKind::AUTH_FAILURE);
        REQUIRE(outcome.attempts == 3);
        REQUIRE(outcome.auth_failures == 3);
        REQUIRE(backend.forget_calls().empty());
        REQUIRE(backend.saved_profile_set().count("HomeNet") == 1);
    }

    SECTION("credential rejected, new password works") {
        presenter.secrets.push_back(std::string("correct-horse"));
        auto outcome = orch.connect(req);
        REQUIRE(outcome.connected());
        REQUIRE(outcome.attempts == 2);
        REQUIRE(backend.forget_calls().empty());
    }
}

// ============================================================================
// Open networks
// ============================================================================

TEST_CASE_METHOD(OrchestratorFixture, "Orchestrator: open networks ask first", "[connect][open]") {
    VpnTrigger vpn(backend, bindings);

    SECTION("declined") {
        ConnectionOrchestrator orch(backend, presenter, vpn, options);
        presenter.confirms.push_back(false);

        auto outcome = orch.connect(open_request());

        REQUIRE(outcome.error == ErrorKind::USER_CANCELLED);
        REQUIRE(outcome.attempts == 0);
        REQUIRE(presenter.confirm_messages.size() == 1);
        REQUIRE(presenter.confirm_messages[0].find("Cafe") != std::string::npos);
        REQUIRE(backend.connect_calls().empty());
    }

    SECTION("accepted") {
        ConnectionOrchestrator orch(backend, presenter, vpn, options);
        presenter.confirms.push_back(true);

        auto outcome = orch.connect(open_request());

        REQUIRE(outcome.connected());
        REQUIRE(presenter.secret_hints.empty());
        REQUIRE(backend.connected_ssid() == "Cafe");
    }

    SECTION("already confirmed") {
        ConnectionOrchestrator orch(backend, presenter, vpn, options);
        auto req = open_request();
        req.open_network_confirmed = true;

        REQUIRE(orch.connect(req).connected());
        REQUIRE(presenter.confirm_messages.empty());
    }

    SECTION("warning disabled") {
        options.warn_open_networks = false;
        ConnectionOrchestrator orch(backend, presenter, vpn, options);

        REQUIRE(orch.connect(open_request()).connected());
        REQUIRE(presenter.confirm_messages.empty());
    }
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_CASE_METHOD(OrchestratorFixture, "Orchestrator: cancel during connect cleans up",
                 "[connect][cancel]") {
    backend.set_connect_delay(3s);
    VpnTrigger vpn(backend, bindings);
    ConnectionOrchestrator orch(backend, presenter, vpn, options);

    auto req = secured_request();
    req.secret = "correct-horse";

    std::thread canceller([&orch]() {
        std::this_thread::sleep_for(100ms);
        orch.cancel();
    });
    auto started = std::chrono::steady_clock::now();
    auto outcome = orch.connect(req);
    canceller.join();

    REQUIRE(std::chrono::steady_clock::now() - started < 2s);
    REQUIRE(outcome.final_state == State::FAILED);
    REQUIRE(outcome.error == ErrorKind::USER_CANCELLED);
    REQUIRE(backend.saved_profile_set().count("HomeNet") == 0);
    REQUIRE(backend.forget_calls() == std::vector<std::string>{"HomeNet"});
    REQUIRE(backend.connected_ssid().empty());
}

namespace {

/// Mock whose activation completes just before a cancel() lands
class CancelAfterSuccessBackend : public WifiBackendMock {
  public:
    ConnectionOrchestrator* orchestrator = nullptr;

    WiFiError connect(const std::string& ssid, const std::optional<std::string>& secret,
                      std::chrono::seconds timeout) override {
        WiFiError result = WifiBackendMock::connect(ssid, secret, timeout);
        if (orchestrator) {
            orchestrator->cancel();
        }
        return result;
    }
};

} // namespace

TEST_CASE("Orchestrator: cancel after a completed connect keeps the link", "[connect][cancel]") {
    CancelAfterSuccessBackend late_backend;
    late_backend.start();
    late_backend.add_network(MockWiFiNetwork("HomeNet", 82, SecurityKind::WPA2, "correct-horse"));

    ScriptedPresenter scripted;
    VpnTrigger::Bindings no_bindings;
    VpnTrigger vpn(late_backend, no_bindings);
    ConnectionOrchestrator::Options opts;
    ConnectionOrchestrator orch(late_backend, scripted, vpn, opts);
    late_backend.orchestrator = &orch;

    ConnectionOrchestrator::Request req;
    req.ssid = "HomeNet";
    req.security = SecurityKind::WPA2;
    req.secret = "correct-horse";
    auto outcome = orch.connect(req);

    REQUIRE(outcome.connected());
    REQUIRE(outcome.error == ErrorKind::NONE);
    REQUIRE(late_backend.connected_ssid() == "HomeNet");
    REQUIRE(late_backend.forget_calls().empty());
    REQUIRE(late_backend.saved_profile_set().count("HomeNet") == 1);
}

TEST_CASE_METHOD(OrchestratorFixture, "Orchestrator: cancel while prompting skips the adapter",
                 "[connect][cancel]") {
    VpnTrigger vpn(backend, bindings);
    ConnectionOrchestrator orch(backend, presenter, vpn, options);
    presenter.secrets.push_back(std::string("correct-horse"));
    presenter.on_prompt_secret = [&orch]() { orch.cancel(); };

    auto outcome = orch.connect(secured_request());

    REQUIRE(outcome.error == ErrorKind::USER_CANCELLED);
    REQUIRE(backend.connect_calls().empty());
}

TEST_CASE_METHOD(OrchestratorFixture, "Orchestrator: a new request clears an old cancel",
                 "[connect][cancel]") {
    VpnTrigger vpn(backend, bindings);
    ConnectionOrchestrator orch(backend, presenter, vpn, options);
    orch.cancel();

    auto req = secured_request();
    req.secret = "correct-horse";
    REQUIRE(orch.connect(req).connected());
}

// ============================================================================
// VPN hand-off
// ============================================================================

TEST_CASE_METHOD(OrchestratorFixture, "Orchestrator: bound VPN starts after connecting",
                 "[connect][vpn]") {
    bindings["HomeNet"] = "work-vpn";
    VpnTrigger vpn(backend, bindings);
    ConnectionOrchestrator orch(backend, presenter, vpn, options);

    auto req = secured_request();
    req.secret = "correct-horse";

    SECTION("VPN comes up") {
        auto outcome = orch.connect(req);
        REQUIRE(outcome.connected());
        REQUIRE(outcome.vpn.has_value());
        REQUIRE(outcome.vpn->profile == "work-vpn");
        REQUIRE(outcome.vpn->result.success());
        REQUIRE(backend.vpn_calls() == std::vector<std::string>{"work-vpn"});
    }

    SECTION("VPN failure keeps Wi-Fi") {
        backend.set_vpn_result(WiFiErrorHelper::backend_error("no such connection"));
        auto outcome = orch.connect(req);
        REQUIRE(outcome.connected());
        REQUIRE(outcome.vpn.has_value());
        REQUIRE_FALSE(outcome.vpn->result.success());
        REQUIRE(backend.connected_ssid() == "HomeNet");
    }

    SECTION("no VPN when the connect fails") {
        backend.script_connect_results({WiFiResult::TIMEOUT});
        auto outcome = orch.connect(req);
        REQUIRE_FALSE(outcome.vpn.has_value());
        REQUIRE(backend.vpn_calls().empty());
    }
}

TEST_CASE_METHOD(OrchestratorFixture, "Orchestrator: state callback sees every transition",
                 "[connect]") {
    VpnTrigger vpn(backend, bindings);
    ConnectionOrchestrator orch(backend, presenter, vpn, options);

    std::vector<State> seen;
    orch.set_state_callback([&seen](State, State to) { seen.push_back(to); });

    auto req = secured_request();
    req.secret = "correct-horse";
    REQUIRE(orch.connect(req).connected());

    REQUIRE(seen == std::vector<State>{State::CONNECTING, State::CONNECTED});
}
