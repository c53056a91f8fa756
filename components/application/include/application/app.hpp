/**
 * @file app.hpp
 * @brief WiFi link bridge application
 *
 * Owns the ESP-IDF platform adapters, the association controller, the
 * scanner and the method-channel plugin, and wires them together.
 */

#pragma once

#include <bridge/event_channel.hpp>
#include <bridge/wifi_plugin.hpp>
#include <core/application.hpp>
#include <network/association_controller.hpp>
#include <network/esp_connectivity.hpp>
#include <network/esp_scan_platform.hpp>
#include <network/wifi_scanner.hpp>

#include <chrono>
#include <span>

namespace application {

/// Application tunables
struct BridgeAppConfig {
  std::chrono::seconds connect_timeout{network::defaults::REQUEST_TIMEOUT};
  const char *scan_stream = "wifi_scan/onScannedResultsAvailable";
  std::chrono::seconds status_interval{60};
};

class BridgeApp final : public core::Application {
public:
  explicit BridgeApp(const BridgeAppConfig &config = {});

protected:
  core::Status run() override;

private:
  static constexpr const char *TAG = "bridge_app";

  static void log_boot_info();
  [[nodiscard]] core::Status init_platform_adapters();
  [[nodiscard]] core::Status init_channel();

  void on_association_state(network::AssociationState from,
                            network::AssociationState to);
  void on_call_frame(std::span<const uint8_t> frame);
  void log_status() const;

  BridgeAppConfig config_;

  network::EspConnectivity connectivity_;
  network::EspScanPlatform scan_platform_;
  network::AssociationController controller_;
  network::WifiScanner scanner_;
  bridge::WifiPlugin plugin_;

  /// Destroyed first so no call frame reaches a dying plugin
  bridge::EventBusChannel channel_;
};

} // namespace application
