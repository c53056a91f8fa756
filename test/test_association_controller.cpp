/**
 * @file test_association_controller.cpp
 * @brief AssociationController behaviour against a scripted platform
 */

#include <doctest/doctest.h>

#include "fakes/fake_connectivity.hpp"

#include <network/association_controller.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using network::AssociationController;
using network::AssociationState;
using network::ConnectionIntent;
using network::NetworkHandle;

namespace {

/// Collects completion results
struct Replies {
  std::vector<bool> values;

  AssociationController::Completion sink() {
    return [this](bool v) { values.push_back(v); };
  }
};

ConnectionIntent home_intent() {
  return {.ssid = "Home", .password = "secret"};
}

bool has_op(const test::FakeConnectivity &fake, const std::string &op) {
  const auto &ops = fake.ops();
  return std::find(ops.begin(), ops.end(), op) != ops.end();
}

bool has_bind(const test::FakeConnectivity &fake) {
  const auto &ops = fake.ops();
  return std::any_of(ops.begin(), ops.end(), [](const std::string &op) {
    return op.rfind("bind:", 0) == 0;
  });
}

} // namespace

// =============================================================================
// Successful association
// =============================================================================

TEST_CASE("PSK network that becomes available resolves true and binds") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies replies;

  REQUIRE(controller.connect(home_intent(), replies.sink()).ok());
  CHECK(controller.state() == AssociationState::Requesting);
  CHECK(replies.values.empty());

  const auto &req = fake.last_request();
  CHECK(req.transport == network::Transport::Wifi);
  CHECK_FALSE(req.internet);
  CHECK(req.specifier.ssid == "Home");
  REQUIRE(req.specifier.passphrase.has_value());
  CHECK(*req.specifier.passphrase == "secret");
  CHECK(req.specifier.security == network::SecurityMode::Psk);

  fake.available(fake.last_registration(), 7);

  CHECK(replies.values == std::vector<bool>{true});
  CHECK(controller.state() == AssociationState::Bound);
  REQUIRE(controller.bound_network().has_value());
  CHECK(controller.bound_network()->id == 7);
  CHECK(fake.bound_network() == NetworkHandle{7});
  CHECK(has_op(fake, "bind:7"));
}

TEST_CASE("Internet requirement and SAE security reach the request") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies replies;

  ConnectionIntent intent{
      .ssid = "Office",
      .bssid = "AA:bb:cc:00:11:22",
      .password = "hunter22",
      .security = network::SecurityMode::Sae,
      .requires_internet = true,
  };
  REQUIRE(controller.connect(intent, replies.sink()).ok());

  const auto &req = fake.last_request();
  CHECK(req.internet);
  CHECK(req.specifier.security == network::SecurityMode::Sae);
  REQUIRE(req.specifier.bssid.has_value());
  CHECK(req.specifier.bssid->to_string() == "aa:bb:cc:00:11:22");
}

TEST_CASE("Second Available does not resolve again") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies replies;

  REQUIRE(controller.connect(home_intent(), replies.sink()).ok());
  auto id = fake.last_registration();
  fake.available(id, 7);
  fake.available(id, 8);

  CHECK(replies.values == std::vector<bool>{true});
  CHECK(controller.bound_network()->id == 7);
}

// =============================================================================
// Failure paths
// =============================================================================

TEST_CASE("Unavailable network resolves false without binding") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies replies;

  REQUIRE(controller.connect({.ssid = "Ghost"}, replies.sink()).ok());
  fake.unavailable(fake.last_registration());

  CHECK(replies.values == std::vector<bool>{false});
  CHECK(controller.state() == AssociationState::Failed);
  CHECK_FALSE(controller.bound_network().has_value());
  CHECK_FALSE(has_bind(fake));
  CHECK(fake.live_registrations() == 0);
}

TEST_CASE("Malformed BSSID is rejected before any platform call") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies replies;

  auto status = controller.connect({.ssid = "Home", .bssid = "not-a-mac"},
                                   replies.sink());

  CHECK(status.error() == ESP_ERR_INVALID_ARG);
  CHECK(replies.values == std::vector<bool>{false});
  CHECK(fake.ops().empty());
  CHECK(controller.state() == AssociationState::Idle);
}

TEST_CASE("Invalid SSID is rejected") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies replies;

  SUBCASE("empty") {
    CHECK(controller.connect({.ssid = ""}, replies.sink()).error() ==
          ESP_ERR_INVALID_ARG);
  }
  SUBCASE("longer than 32 bytes") {
    CHECK(controller.connect({.ssid = std::string(33, 'x')}, replies.sink())
              .error() == ESP_ERR_INVALID_ARG);
  }
  CHECK(replies.values == std::vector<bool>{false});
  CHECK(fake.ops().empty());
}

TEST_CASE("Empty optional fields are ignored with a warning") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies replies;

  ConnectionIntent intent{
      .ssid = "Home",
      .bssid = "",
      .password = "",
      .security = network::SecurityMode::Unspecified,
  };
  REQUIRE(controller.connect(intent, replies.sink()).ok());

  const auto &req = fake.last_request();
  CHECK_FALSE(req.specifier.bssid.has_value());
  CHECK_FALSE(req.specifier.passphrase.has_value());
  CHECK(req.specifier.security == network::SecurityMode::Psk);
}

TEST_CASE("Platform refusing the request fails the session") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies replies;

  fake.fail_next_request(ESP_ERR_NO_MEM);
  auto status = controller.connect(home_intent(), replies.sink());

  CHECK(status.error() == ESP_ERR_NO_MEM);
  CHECK(replies.values == std::vector<bool>{false});
  CHECK(controller.state() == AssociationState::Failed);
}

TEST_CASE("Platform without any backend is not supported") {
  test::FakeConnectivity fake(network::PlatformCapabilities{});
  AssociationController controller(fake);
  Replies replies;

  auto status = controller.connect(home_intent(), replies.sink());

  CHECK(status.error() == ESP_ERR_NOT_SUPPORTED);
  CHECK(replies.values == std::vector<bool>{false});
  CHECK(fake.ops().empty());
  CHECK_FALSE(controller.has_backend(network::BackendKind::NetworkRequest));
  CHECK_FALSE(controller.has_backend(network::BackendKind::ConfiguredNetwork));
}

// =============================================================================
// Session lifecycle
// =============================================================================

TEST_CASE("Disconnect without a session is a no-op") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);

  CHECK_FALSE(controller.disconnect());
  CHECK_FALSE(controller.disconnect());
  CHECK(fake.ops().empty());
  CHECK(controller.state() == AssociationState::Idle);
}

TEST_CASE("Disconnect while requesting resolves false and unregisters") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies replies;

  REQUIRE(controller.connect(home_intent(), replies.sink()).ok());
  auto id = fake.last_registration();

  CHECK(controller.disconnect());
  CHECK(replies.values == std::vector<bool>{false});
  CHECK(has_op(fake, "unregister:" + std::to_string(id)));
  CHECK(controller.state() == AssociationState::Idle);
  CHECK_FALSE(controller.disconnect());

  // Late event from the released registration changes nothing
  fake.emit_late(id, {.type = network::PlatformEventType::Available,
                      .network = {3}});
  CHECK(replies.values == std::vector<bool>{false});
  CHECK_FALSE(has_bind(fake));
}

TEST_CASE("Disconnect after binding clears the binding") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies replies;

  REQUIRE(controller.connect(home_intent(), replies.sink()).ok());
  fake.available(fake.last_registration(), 7);

  CHECK(controller.disconnect());
  CHECK(replies.values == std::vector<bool>{true});
  CHECK(has_op(fake, "bind:none"));
  CHECK_FALSE(fake.bound_network().has_value());
  CHECK(fake.live_registrations() == 0);
}

TEST_CASE("Repeated connect calls never leak registrations") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies replies;

  for (int i = 0; i < 5; ++i) {
    REQUIRE(controller.connect(home_intent(), replies.sink()).ok());
    CHECK(fake.live_registrations() == 1);
  }

  // Every superseded caller got exactly one false
  CHECK(replies.values == std::vector<bool>(4, false));

  fake.available(fake.last_registration(), 9);
  CHECK(replies.values.size() == 5);
  CHECK(replies.values.back());
}

TEST_CASE("Superseded request is unregistered before the next is issued") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies a;
  Replies b;

  REQUIRE(controller.connect({.ssid = "A"}, a.sink()).ok());
  auto id_a = fake.last_registration();
  REQUIRE(controller.connect({.ssid = "B"}, b.sink()).ok());
  auto id_b = fake.last_registration();

  std::vector<std::string> expected{"request:A",
                                    "unregister:" + std::to_string(id_a),
                                    "request:B"};
  CHECK(fake.ops() == expected);
  CHECK(a.values == std::vector<bool>{false});

  // A's platform still fires after being replaced: ignored
  fake.emit_late(id_a, {.type = network::PlatformEventType::Available,
                        .network = {5}});
  CHECK_FALSE(has_bind(fake));
  CHECK(b.values.empty());

  fake.available(id_b, 6);
  CHECK(b.values == std::vector<bool>{true});
  CHECK(a.values == std::vector<bool>{false});
  CHECK(controller.bound_network()->id == 6);
}

TEST_CASE("Lost after Available keeps the success result") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies replies;

  REQUIRE(controller.connect(home_intent(), replies.sink()).ok());
  auto id = fake.last_registration();
  fake.available(id, 7);

  SUBCASE("lost for another network is ignored") {
    fake.lost(id, 8);
    CHECK(controller.state() == AssociationState::Bound);
    CHECK(controller.bound_network().has_value());
  }

  SUBCASE("losing is diagnostic only") {
    fake.emit(id, {.type = network::PlatformEventType::Losing,
                   .network = {7},
                   .max_time_to_live = std::chrono::milliseconds(3000)});
    CHECK(controller.state() == AssociationState::Bound);
  }

  SUBCASE("lost for the bound network returns to idle") {
    fake.lost(id, 7);
    CHECK(controller.state() == AssociationState::Idle);
    CHECK_FALSE(controller.bound_network().has_value());
    CHECK(has_op(fake, "bind:none"));
    CHECK(has_op(fake, "unregister:" + std::to_string(id)));
  }

  CHECK(replies.values == std::vector<bool>{true});
}

TEST_CASE("Unavailable after binding fails the session without re-resolving") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies replies;

  REQUIRE(controller.connect(home_intent(), replies.sink()).ok());
  auto id = fake.last_registration();
  fake.available(id, 7);
  fake.unavailable(id);

  CHECK(replies.values == std::vector<bool>{true});
  CHECK(controller.state() == AssociationState::Failed);
  CHECK_FALSE(fake.bound_network().has_value());

  // A failed session is not "active"
  CHECK_FALSE(controller.disconnect());
  CHECK(controller.state() == AssociationState::Idle);
}

TEST_CASE("Destroying the controller releases the registration") {
  test::FakeConnectivity fake;
  Replies replies;
  {
    AssociationController controller(fake);
    REQUIRE(controller.connect(home_intent(), replies.sink()).ok());
  }
  CHECK(fake.live_registrations() == 0);
  CHECK(replies.values == std::vector<bool>{false});
}

// =============================================================================
// Timeouts
// =============================================================================

TEST_CASE("Timeout is forwarded only when the platform enforces one") {
  Replies replies;

  SUBCASE("supported") {
    test::FakeConnectivity fake;
    AssociationController controller(fake);
    ConnectionIntent intent = home_intent();
    intent.timeout = std::chrono::seconds(10);
    REQUIRE(controller.connect(intent, replies.sink()).ok());
    CHECK(fake.last_timeout() == std::chrono::milliseconds(10000));
  }

  SUBCASE("zero uses the configured default") {
    test::FakeConnectivity fake;
    AssociationController controller(
        fake, {.default_timeout = std::chrono::seconds(5)});
    ConnectionIntent intent = home_intent();
    intent.timeout = std::chrono::milliseconds(0);
    REQUIRE(controller.connect(intent, replies.sink()).ok());
    CHECK(fake.last_timeout() == std::chrono::milliseconds(5000));
  }

  SUBCASE("unsupported") {
    test::FakeConnectivity fake(
        network::PlatformCapabilities{.network_request = true});
    AssociationController controller(fake);
    REQUIRE(controller.connect(home_intent(), replies.sink()).ok());
    CHECK(fake.last_timeout() == std::chrono::milliseconds(0));
  }
}

// =============================================================================
// Configured-network path
// =============================================================================

TEST_CASE("Configured-network backend resolves on acceptance") {
  test::FakeConnectivity fake(
      network::PlatformCapabilities{.configured_networks = true});
  AssociationController controller(fake);
  Replies replies;

  CHECK_FALSE(controller.has_backend(network::BackendKind::NetworkRequest));
  REQUIRE(controller.connect(home_intent(), replies.sink()).ok());

  CHECK(replies.values == std::vector<bool>{true});
  CHECK(controller.state() == AssociationState::Bound);
  CHECK(fake.ops() == std::vector<std::string>{"add:Home", "enable:100"});
  CHECK_FALSE(has_bind(fake));

  CHECK(controller.disconnect());
  CHECK(has_op(fake, "disable:100"));
  CHECK(fake.configured_count() == 0);
}

TEST_CASE("force_compat selects the configured-network backend") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies replies;

  ConnectionIntent intent = home_intent();
  intent.force_compat = true;
  REQUIRE(controller.connect(intent, replies.sink()).ok());

  CHECK(has_op(fake, "add:Home"));
  CHECK_FALSE(has_op(fake, "request:Home"));
  CHECK(replies.values == std::vector<bool>{true});
}

TEST_CASE("force_compat without a configured-network backend") {
  test::FakeConnectivity fake(
      network::PlatformCapabilities{.network_request = true});
  AssociationController controller(fake);
  Replies replies;

  ConnectionIntent intent = home_intent();
  intent.force_compat = true;
  CHECK(controller.connect(intent, replies.sink()).error() ==
        ESP_ERR_NOT_SUPPORTED);
  CHECK(replies.values == std::vector<bool>{false});
  CHECK(fake.ops().empty());
}

TEST_CASE("Configured network that cannot be enabled resolves false") {
  test::FakeConnectivity fake(
      network::PlatformCapabilities{.configured_networks = true});
  AssociationController controller(fake);
  Replies replies;

  fake.fail_next_enable(ESP_FAIL);
  CHECK_FALSE(controller.connect(home_intent(), replies.sink()).ok());
  CHECK(replies.values == std::vector<bool>{false});
  CHECK(fake.configured_count() == 0);
}

// =============================================================================
// Binding and observers
// =============================================================================

TEST_CASE("Redundant binds succeed without touching the platform") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);

  CHECK(controller.bind_process_traffic(NetworkHandle{3}).ok());
  CHECK(controller.bind_process_traffic(NetworkHandle{3}).ok());
  CHECK(fake.ops() == std::vector<std::string>{"bind:3"});

  CHECK(controller.bind_process_traffic(std::nullopt).ok());
  CHECK(controller.bind_process_traffic(std::nullopt).ok());
  CHECK(fake.ops() == std::vector<std::string>{"bind:3", "bind:none"});
}

TEST_CASE("State observer sees every transition") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies replies;

  std::vector<std::pair<AssociationState, AssociationState>> seen;
  controller.on_state_change(
      [&](AssociationState from, AssociationState to) {
        seen.emplace_back(from, to);
      });

  REQUIRE(controller.connect(home_intent(), replies.sink()).ok());
  fake.available(fake.last_registration(), 7);
  CHECK(controller.disconnect());

  using S = AssociationState;
  std::vector<std::pair<S, S>> expected{
      {S::Idle, S::Requesting},
      {S::Requesting, S::Bound},
      {S::Bound, S::Idle},
  };
  CHECK(seen == expected);
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_CASE("Unavailable delivered during the request releases the registration") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies replies;

  fake.during_next_request(
      [&](network::RegistrationId id) { fake.unavailable(id); });
  REQUIRE(controller.connect(home_intent(), replies.sink()).ok());

  CHECK(replies.values == std::vector<bool>{false});
  CHECK(controller.state() == AssociationState::Failed);
  CHECK(fake.live_registrations() == 0);
  CHECK(has_op(fake, "unregister:1"));
  CHECK_FALSE(has_bind(fake));
}

TEST_CASE("Available delivered during the request keeps the registration") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies replies;

  fake.during_next_request(
      [&](network::RegistrationId id) { fake.available(id, 5); });
  REQUIRE(controller.connect(home_intent(), replies.sink()).ok());

  CHECK(replies.values == std::vector<bool>{true});
  CHECK(controller.state() == AssociationState::Bound);
  CHECK(fake.live_registrations() == 1);

  CHECK(controller.disconnect());
  CHECK(has_op(fake, "unregister:1"));
  CHECK(fake.live_registrations() == 0);
}

TEST_CASE("Overlapping connect calls reach the platform in session order") {
  using namespace std::chrono_literals;

  test::FakeConnectivity fake;
  AssociationController controller(fake);

  std::mutex results_mutex;
  std::vector<std::pair<std::string, bool>> results;
  auto sink = [&](std::string name) {
    return [&, name](bool v) {
      std::lock_guard lock(results_mutex);
      results.emplace_back(name, v);
    };
  };

  fake.hold_request("A");
  std::thread first(
      [&] { (void)controller.connect({.ssid = "A"}, sink("A")); });
  fake.wait_for_held_request();

  // B must wait for A's request to be recorded before tearing it down
  std::thread second(
      [&] { (void)controller.connect({.ssid = "B"}, sink("B")); });
  std::this_thread::sleep_for(50ms);
  fake.release_held_request();

  first.join();
  second.join();

  CHECK(fake.ops() ==
        std::vector<std::string>{"request:A", "unregister:1", "request:B"});
  CHECK(fake.live_registrations() == 1);
  CHECK(controller.state() == AssociationState::Requesting);

  fake.available(fake.last_registration(), 9);

  std::lock_guard lock(results_mutex);
  CHECK(results == std::vector<std::pair<std::string, bool>>{{"A", false},
                                                             {"B", true}});
}

TEST_CASE("Events racing disconnect resolve once and leave nothing bound") {
  for (int i = 0; i < 50; ++i) {
    test::FakeConnectivity fake;
    AssociationController controller(fake);
    std::atomic<int> calls{0};

    REQUIRE(controller.connect(home_intent(), [&](bool) { ++calls; }).ok());
    const auto registration = fake.last_registration();

    std::thread platform([&] { fake.available(registration, 7); });
    (void)controller.disconnect();
    platform.join();

    CHECK(calls.load() == 1);
    CHECK(controller.state() == AssociationState::Idle);
    CHECK(fake.live_registrations() == 0);
    CHECK_FALSE(controller.bound_network().has_value());
    CHECK_FALSE(fake.bound_network().has_value());
  }
}

TEST_CASE("A completion may start the next session from inside connect") {
  test::FakeConnectivity fake;
  AssociationController controller(fake);
  Replies replies;
  bool retried = false;

  REQUIRE(controller.connect(home_intent(), [&](bool ok) {
    if (!ok) {
      retried =
          controller.connect({.ssid = "Retry"}, replies.sink()).ok();
    }
  }).ok());

  // Superseding Home resolves it false while the caller holds the session
  REQUIRE(controller.connect({.ssid = "Next"}, replies.sink()).ok());

  CHECK(retried);
  CHECK(replies.values == std::vector<bool>{false});
  CHECK(fake.live_registrations() == 1);

  fake.available(2, 4);
  CHECK(replies.values == std::vector<bool>{false, true});
  CHECK(controller.state() == AssociationState::Bound);
}
