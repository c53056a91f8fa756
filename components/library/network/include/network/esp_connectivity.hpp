/**
 * @file esp_connectivity.hpp
 * @brief IConnectivity over the ESP-IDF WiFi station and netif
 *
 * The station joins one network at a time, so at most one network request
 * is active. Requests are bounded by a one-shot timer that reports the
 * network unavailable on expiry. Binding routes default traffic through
 * the station interface and restores the previous default when cleared.
 */

#pragma once

#include "connectivity.hpp"

#include <core/event_loop.hpp>
#include <core/mutex.hpp>
#include <core/result.hpp>
#include <core/timer.hpp>

#include <esp_event.h>
#include <esp_netif.h>
#include <esp_wifi.h>

#include <chrono>
#include <optional>
#include <utility>
#include <vector>

namespace network {

class EspConnectivity final : public IConnectivity {
public:
  EspConnectivity();
  ~EspConnectivity() override;

  /// Bring up netif and the WiFi driver in station mode
  [[nodiscard]] core::Status init();

  [[nodiscard]] PlatformCapabilities capabilities() const override {
    return {
        .network_request = true,
        .request_timeout = true,
        .configured_networks = true,
    };
  }

  [[nodiscard]] core::Result<RegistrationId>
  request_network(const NetworkRequest &request, EventHandler handler,
                  std::chrono::milliseconds timeout) override;

  [[nodiscard]] core::Status
  unregister_network_callback(RegistrationId id) override;

  [[nodiscard]] core::Status
  bind_process_to_network(std::optional<NetworkHandle> network) override;

  [[nodiscard]] std::optional<NetworkHandle> bound_network() const override;

  [[nodiscard]] core::Result<NetworkHandle>
  add_configured_network(const ConfiguredNetwork &network) override;

  [[nodiscard]] core::Status
  enable_configured_network(NetworkHandle network) override;

  [[nodiscard]] core::Status
  disable_configured_network(NetworkHandle network) override;

  [[nodiscard]] std::optional<std::string> current_ssid() const override;

  [[nodiscard]] std::optional<uint32_t> current_ipv4() const override;

private:
  struct ActiveRequest {
    RegistrationId id = kNoRegistration;
    NetworkRequest request;
    EventHandler handler;
    bool available = false;
    NetworkHandle network{};
  };

  struct StoredNetwork {
    NetworkHandle handle;
    ConfiguredNetwork config;
  };

  using Delivery = std::pair<EventHandler, PlatformEvent>;

  [[nodiscard]] static core::Status apply_station_config(
      const NetworkSpecifier &specifier);

  [[nodiscard]] core::Status start_association(
      const NetworkSpecifier &specifier);

  /// Ends the active request with Unavailable (caller holds the lock)
  [[nodiscard]] Delivery fail_active_locked();

  void on_wifi_event(int32_t event_id, void *event_data);
  void on_ip_event(int32_t event_id, void *event_data);
  void on_timeout();

  static void deliver(std::optional<Delivery> delivery);

  static void wifi_event_handler(void *arg, esp_event_base_t base,
                                 int32_t event_id, void *event_data);
  static void ip_event_handler(void *arg, esp_event_base_t base,
                               int32_t event_id, void *event_data);

  mutable core::Mutex mutex_;
  esp_netif_t *netif_ = nullptr;
  esp_netif_t *previous_default_ = nullptr;

  std::optional<ActiveRequest> active_;
  std::vector<StoredNetwork> stored_;
  std::optional<NetworkHandle> enabled_stored_;
  std::optional<NetworkHandle> bound_;

  RegistrationId next_registration_ = 1;
  uint32_t next_network_ = 1;

  core::OneShotTimer timeout_timer_;
  core::EventSubscription wifi_sub_;
  core::EventSubscription ip_sub_;

  bool initialized_ = false;
};

} // namespace network
