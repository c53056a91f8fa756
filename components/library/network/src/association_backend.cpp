/**
 * @file association_backend.cpp
 * @brief Association backend implementations
 */

#include "network/association_backend.hpp"

#include <esp_log.h>

#include <cinttypes>

namespace network {

namespace {
constexpr const char *TAG = "assoc_backend";
} // namespace

core::Result<RegistrationId>
NetworkRequestBackend::request(const NetworkRequest &request,
                               EventHandler handler,
                               std::chrono::milliseconds timeout) {
  return platform_.request_network(request, std::move(handler),
                                   timeout_ ? timeout
                                            : std::chrono::milliseconds{0});
}

core::Status NetworkRequestBackend::release(RegistrationId id) {
  return platform_.unregister_network_callback(id);
}

core::Result<RegistrationId>
ConfiguredNetworkBackend::request(const NetworkRequest &request,
                                  EventHandler handler,
                                  std::chrono::milliseconds /*timeout*/) {
  if (request.specifier.bssid) {
    ESP_LOGW(TAG, "BSSID is not used by stored configurations");
  }

  auto network = platform_.add_configured_network(ConfiguredNetwork{
      .ssid = request.specifier.ssid,
      .passphrase = request.specifier.passphrase,
  });
  if (!network) {
    ESP_LOGE(TAG, "Failed to add configuration for '%s': %s",
             request.specifier.ssid.c_str(), esp_err_to_name(network.error()));
    return core::Err(network.error());
  }

  if (auto err = platform_.enable_configured_network(*network); !err) {
    ESP_LOGE(TAG, "Failed to enable configuration %" PRIu32 ": %s",
             network->id, esp_err_to_name(err.error()));
    (void)platform_.disable_configured_network(*network);
    return core::Err(err.error());
  }

  ESP_LOGI(TAG, "Configuration %" PRIu32 " enabled for '%s'", network->id,
           request.specifier.ssid.c_str());

  // The configuration is accepted; there is nothing further to wait for.
  handler(PlatformEvent{
      .type = PlatformEventType::Available,
      .network = *network,
  });

  return RegistrationId{network->id};
}

core::Status ConfiguredNetworkBackend::release(RegistrationId id) {
  return platform_.disable_configured_network(NetworkHandle{id});
}

AssociationBackends detect_backends(IConnectivity &platform) {
  auto caps = platform.capabilities();

  AssociationBackends backends;
  if (caps.network_request) {
    backends.request = std::make_unique<NetworkRequestBackend>(platform);
  }
  if (caps.configured_networks) {
    backends.compat = std::make_unique<ConfiguredNetworkBackend>(platform);
  }

  ESP_LOGI(TAG, "Platform backends: network-request=%s (timeout %s), "
                "configured-network=%s",
           caps.network_request ? "yes" : "no",
           caps.request_timeout ? "yes" : "no",
           caps.configured_networks ? "yes" : "no");
  return backends;
}

} // namespace network
