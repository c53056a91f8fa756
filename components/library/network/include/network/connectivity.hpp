/**
 * @file connectivity.hpp
 * @brief Platform connectivity interface
 *
 * Abstracts the platform's connectivity subsystem: capability-based network
 * requests with asynchronous events, process-wide traffic binding, and the
 * older stored-configuration path. EspConnectivity implements it on ESP-IDF;
 * tests substitute a fake.
 */

#pragma once

#include "mac_address.hpp"
#include "wifi_types.hpp"

#include <core/result.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace network {

enum class Transport : uint8_t {
  Wifi,
};

/// Identifies the network a request should match
struct NetworkSpecifier {
  std::string ssid;
  std::optional<MacAddress> bssid;
  std::optional<std::string> passphrase;
  SecurityMode security = SecurityMode::Psk;
};

/// Capability filter plus specifier
struct NetworkRequest {
  Transport transport = Transport::Wifi;

  /// true: internet capability required, false: explicitly not required
  bool internet = false;

  NetworkSpecifier specifier;
};

enum class PlatformEventType : uint8_t {
  Available,
  Losing,
  Lost,
  Unavailable,
};

[[nodiscard]] constexpr const char *to_string(PlatformEventType type) {
  switch (type) {
  case PlatformEventType::Available:
    return "available";
  case PlatformEventType::Losing:
    return "losing";
  case PlatformEventType::Lost:
    return "lost";
  case PlatformEventType::Unavailable:
    return "unavailable";
  default:
    return "?";
  }
}

/// Event delivered for one registration
struct PlatformEvent {
  PlatformEventType type = PlatformEventType::Unavailable;

  /// Network concerned (unset for Unavailable)
  NetworkHandle network{};

  /// Losing only: time until the network is expected to go away
  std::chrono::milliseconds max_time_to_live{0};
};

/// Single handler per registration; may run on a platform task
using EventHandler = std::function<void(const PlatformEvent &)>;

/// What the platform can do, read once at controller construction
struct PlatformCapabilities {
  /// Capability-based network requests with Available/Lost/... events
  bool network_request = false;

  /// Platform enforces a timeout on network requests
  bool request_timeout = false;

  /// Stored network configurations that can be enabled/disabled
  bool configured_networks = false;
};

/// Network configuration for the stored-configuration path
struct ConfiguredNetwork {
  std::string ssid;
  std::optional<std::string> passphrase;
};

/// Platform connectivity subsystem
class IConnectivity {
public:
  virtual ~IConnectivity() = default;

  IConnectivity(const IConnectivity &) = delete;
  IConnectivity &operator=(const IConnectivity &) = delete;
  IConnectivity(IConnectivity &&) = delete;
  IConnectivity &operator=(IConnectivity &&) = delete;

  [[nodiscard]] virtual PlatformCapabilities capabilities() const = 0;

  /// Issue a network request; events are delivered to handler until the
  /// registration is unregistered or the platform reports Unavailable.
  /// The handler must not be invoked while platform locks are held.
  [[nodiscard]] virtual core::Result<RegistrationId>
  request_network(const NetworkRequest &request, EventHandler handler,
                  std::chrono::milliseconds timeout) = 0;

  /// Unregister exactly this registration
  /// @return ESP_ERR_NOT_FOUND if unknown or already released
  [[nodiscard]] virtual core::Status
  unregister_network_callback(RegistrationId id) = 0;

  /// Route process traffic through network (nullopt clears the binding)
  [[nodiscard]] virtual core::Status
  bind_process_to_network(std::optional<NetworkHandle> network) = 0;

  [[nodiscard]] virtual std::optional<NetworkHandle> bound_network() const = 0;

  /// Store a network configuration, returning its handle
  [[nodiscard]] virtual core::Result<NetworkHandle>
  add_configured_network(const ConfiguredNetwork &network) = 0;

  /// Make a stored configuration the active one and start joining it
  [[nodiscard]] virtual core::Status
  enable_configured_network(NetworkHandle network) = 0;

  /// Stop using and forget a stored configuration
  /// @return ESP_ERR_NOT_FOUND if unknown
  [[nodiscard]] virtual core::Status
  disable_configured_network(NetworkHandle network) = 0;

  /// SSID of the currently associated network
  [[nodiscard]] virtual std::optional<std::string> current_ssid() const = 0;

  /// IPv4 address of the station interface, packed little-endian
  [[nodiscard]] virtual std::optional<uint32_t> current_ipv4() const = 0;

protected:
  IConnectivity() = default;
};

} // namespace network
