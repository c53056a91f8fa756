/**
 * @file test_wifi_scanner.cpp
 * @brief WifiScanner pass-through and results stream
 */

#include <doctest/doctest.h>

#include "fakes/fake_scan_platform.hpp"

#include <network/wifi_scanner.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using network::AccessPoint;
using network::ScanReadiness;

namespace {

struct RecordingListener : network::IScanListener {
  std::vector<std::vector<AccessPoint>> batches;
  std::vector<esp_err_t> errors;

  void on_results(const std::vector<AccessPoint> &results) override {
    batches.push_back(results);
  }
  void on_error(esp_err_t error) override { errors.push_back(error); }
};

std::vector<AccessPoint> two_networks() {
  return {
      {.ssid = "Home", .bssid = "00:11:22:33:44:55", .level_dbm = -40},
      {.ssid = "Cafe", .bssid = "66:77:88:99:aa:bb", .level_dbm = -71},
  };
}

} // namespace

TEST_CASE("Readiness and scans delegate to the platform") {
  test::FakeScanPlatform platform;
  network::WifiScanner scanner(platform);

  CHECK(platform.has_handler());
  CHECK(scanner.can_start_scan(true) == ScanReadiness::Yes);
  CHECK(platform.last_ask_permissions);

  platform.readiness = ScanReadiness::NoLocationPermissionDenied;
  CHECK(scanner.can_get_scanned_results(false) ==
        ScanReadiness::NoLocationPermissionDenied);
  CHECK(network::to_code(ScanReadiness::NoLocationPermissionDenied) == 3);

  CHECK(scanner.start_scan());
  CHECK(platform.scans_started == 1);

  platform.start_error = ESP_ERR_INVALID_STATE;
  CHECK_FALSE(scanner.start_scan());
  CHECK(platform.scans_started == 1);
}

TEST_CASE("Latest results are returned from the platform cache") {
  test::FakeScanPlatform platform;
  network::WifiScanner scanner(platform);

  CHECK(scanner.scanned_results().empty());
  platform.complete(two_networks());

  auto results = scanner.scanned_results();
  REQUIRE(results.size() == 2);
  CHECK(results[0].ssid == "Home");
  CHECK(results[1].level_dbm == -71);
}

TEST_CASE("Subscribers receive every result list until released") {
  test::FakeScanPlatform platform;
  network::WifiScanner scanner(platform);
  RecordingListener first;
  RecordingListener second;

  auto sub_first = scanner.subscribe(first);
  {
    auto sub_second = scanner.subscribe(second);
    CHECK(scanner.subscriber_count() == 2);
    platform.complete(two_networks());
  }
  CHECK(scanner.subscriber_count() == 1);
  platform.complete({});

  CHECK(first.batches.size() == 2);
  CHECK(first.batches[1].empty());
  CHECK(second.batches.size() == 1);
  CHECK(second.batches[0].size() == 2);
}

TEST_CASE("A scan error terminates the stream for every subscriber") {
  test::FakeScanPlatform platform;
  network::WifiScanner scanner(platform);
  RecordingListener first;
  RecordingListener second;

  auto sub_first = scanner.subscribe(first);
  auto sub_second = scanner.subscribe(second);

  platform.fail(ESP_FAIL);

  CHECK(first.errors == std::vector<esp_err_t>{ESP_FAIL});
  CHECK(second.errors == std::vector<esp_err_t>{ESP_FAIL});
  CHECK(scanner.subscriber_count() == 0);
  CHECK_FALSE(sub_first.active());

  // Closed listeners see nothing further
  platform.complete(two_networks());
  CHECK(first.batches.empty());

  // Releasing a terminated subscription is harmless
  sub_first.reset();
  sub_second.reset();
  CHECK(scanner.subscriber_count() == 0);
}

TEST_CASE("Subscriptions can be moved") {
  test::FakeScanPlatform platform;
  network::WifiScanner scanner(platform);
  RecordingListener listener;

  network::WifiScanner::Subscription outer;
  CHECK_FALSE(outer.active());
  {
    auto inner = scanner.subscribe(listener);
    outer = std::move(inner);
  }
  CHECK(outer.active());
  CHECK(scanner.subscriber_count() == 1);

  outer.reset();
  CHECK(scanner.subscriber_count() == 0);
}

TEST_CASE("A listener can release another from inside a callback") {
  test::FakeScanPlatform platform;
  network::WifiScanner scanner(platform);

  RecordingListener second;
  network::WifiScanner::Subscription second_sub;

  struct Releasing : network::IScanListener {
    network::WifiScanner::Subscription *target = nullptr;
    int calls = 0;
    void on_results(const std::vector<AccessPoint> &) override {
      ++calls;
      target->reset();
    }
    void on_error(esp_err_t) override {}
  } first;
  first.target = &second_sub;

  // Listeners are delivered in subscription order
  auto first_sub = scanner.subscribe(first);
  second_sub = scanner.subscribe(second);

  platform.complete(two_networks());

  CHECK(first.calls == 1);
  CHECK(second.batches.empty());
  CHECK(scanner.subscriber_count() == 1);
}

TEST_CASE("Releasing a subscription waits for a delivery in progress") {
  using namespace std::chrono_literals;

  test::FakeScanPlatform platform;
  network::WifiScanner scanner(platform);

  struct Blocking : network::IScanListener {
    std::atomic<int> calls{0};
    std::atomic<bool> entered{false};
    std::atomic<bool> leave{false};
    void on_results(const std::vector<AccessPoint> &) override {
      ++calls;
      entered = true;
      while (!leave) {
        std::this_thread::sleep_for(1ms);
      }
    }
    void on_error(esp_err_t) override {}
  } listener;

  auto sub = scanner.subscribe(listener);
  std::atomic<bool> released{false};

  std::thread delivery([&] { platform.complete(two_networks()); });
  while (!listener.entered) {
    std::this_thread::sleep_for(1ms);
  }

  std::thread release([&] {
    sub.reset();
    released = true;
  });
  std::this_thread::sleep_for(50ms);
  CHECK_FALSE(released.load());

  listener.leave = true;
  delivery.join();
  release.join();
  CHECK(released.load());

  platform.complete(two_networks());
  CHECK(listener.calls.load() == 1);
}
