/**
 * @file esp_connectivity.cpp
 * @brief EspConnectivity implementation
 */

#include "network/esp_connectivity.hpp"

#include <esp_log.h>

#include <algorithm>
#include <cinttypes>
#include <cstring>

namespace network {

namespace {
constexpr const char *TAG = "esp_conn";

/// RSSI below which the network is reported as losing
constexpr int32_t kLosingRssiDbm = -85;

/// Disconnect reasons that mean the requested network cannot be joined
bool is_terminal_reason(uint16_t reason) {
  switch (reason) {
  case WIFI_REASON_NO_AP_FOUND:
  case WIFI_REASON_AUTH_FAIL:
  case WIFI_REASON_4WAY_HANDSHAKE_TIMEOUT:
  case WIFI_REASON_HANDSHAKE_TIMEOUT:
  case WIFI_REASON_CONNECTION_FAIL:
    return true;
  default:
    return false;
  }
}

/// Retry the station connection after a disconnect
void reconnect() {
  if (auto err = esp_wifi_connect(); err != ESP_OK) {
    ESP_LOGW(TAG, "esp_wifi_connect: %s", esp_err_to_name(err));
  }
}

} // namespace

EspConnectivity::EspConnectivity()
    : timeout_timer_("net_req_timeout", [this]() { on_timeout(); }) {}

EspConnectivity::~EspConnectivity() {
  if (initialized_) {
    wifi_sub_.unsubscribe();
    ip_sub_.unsubscribe();
    (void)timeout_timer_.stop();
    (void)esp_wifi_disconnect();
    (void)esp_wifi_stop();
    (void)esp_wifi_deinit();
    if (netif_ != nullptr) {
      esp_netif_destroy_default_wifi(netif_);
    }
  }
}

core::Status EspConnectivity::init() {
  if (initialized_) {
    return core::Err(ESP_ERR_INVALID_STATE);
  }

  if (auto err = esp_netif_init(); err != ESP_OK) {
    ESP_LOGE(TAG, "esp_netif_init failed: %s", esp_err_to_name(err));
    return core::Err(err);
  }

  netif_ = esp_netif_create_default_wifi_sta();
  if (netif_ == nullptr) {
    ESP_LOGE(TAG, "Failed to create netif");
    return core::Err(ESP_ERR_NO_MEM);
  }

  wifi_init_config_t wifi_init = WIFI_INIT_CONFIG_DEFAULT();
  if (auto err = esp_wifi_init(&wifi_init); err != ESP_OK) {
    ESP_LOGE(TAG, "esp_wifi_init failed: %s", esp_err_to_name(err));
    return core::Err(err);
  }

  // Configurations live in RAM; nothing is persisted by the driver
  if (auto err = esp_wifi_set_storage(WIFI_STORAGE_RAM); err != ESP_OK) {
    ESP_LOGW(TAG, "esp_wifi_set_storage: %s", esp_err_to_name(err));
  }

  if (auto err = esp_wifi_set_mode(WIFI_MODE_STA); err != ESP_OK) {
    ESP_LOGE(TAG, "esp_wifi_set_mode failed: %s", esp_err_to_name(err));
    return core::Err(err);
  }

  if (auto err = timeout_timer_.create(); !err) {
    ESP_LOGE(TAG, "Timer create failed: %s", esp_err_to_name(err.error()));
    return err;
  }

  wifi_sub_ = core::events().subscribe(WIFI_EVENT, ESP_EVENT_ANY_ID,
                                       wifi_event_handler, this);
  ip_sub_ = core::events().subscribe(IP_EVENT, IP_EVENT_STA_GOT_IP,
                                     ip_event_handler, this);
  if (!wifi_sub_ || !ip_sub_) {
    ESP_LOGE(TAG, "Event subscription failed");
    return core::Err(ESP_FAIL);
  }

  if (auto err = esp_wifi_start(); err != ESP_OK) {
    ESP_LOGE(TAG, "esp_wifi_start failed: %s", esp_err_to_name(err));
    return core::Err(err);
  }

  initialized_ = true;
  ESP_LOGI(TAG, "Station ready");
  return core::Ok();
}

core::Status
EspConnectivity::apply_station_config(const NetworkSpecifier &specifier) {
  wifi_config_t wifi_config{};
  std::strncpy(reinterpret_cast<char *>(wifi_config.sta.ssid),
               specifier.ssid.c_str(), sizeof(wifi_config.sta.ssid));

  if (specifier.passphrase) {
    std::strncpy(reinterpret_cast<char *>(wifi_config.sta.password),
                 specifier.passphrase->c_str(),
                 sizeof(wifi_config.sta.password));
    if (specifier.security == SecurityMode::Sae) {
      wifi_config.sta.threshold.authmode = WIFI_AUTH_WPA3_PSK;
      wifi_config.sta.pmf_cfg.required = true;
    } else {
      wifi_config.sta.threshold.authmode = WIFI_AUTH_WPA2_PSK;
    }
    wifi_config.sta.sae_pwe_h2e = WPA3_SAE_PWE_BOTH;
  } else {
    wifi_config.sta.threshold.authmode = WIFI_AUTH_OPEN;
  }

  if (specifier.bssid) {
    wifi_config.sta.bssid_set = true;
    std::copy(specifier.bssid->bytes().begin(), specifier.bssid->bytes().end(),
              wifi_config.sta.bssid);
  }

  wifi_config.sta.pmf_cfg.capable = true;

  if (auto err = esp_wifi_set_config(WIFI_IF_STA, &wifi_config);
      err != ESP_OK) {
    ESP_LOGE(TAG, "esp_wifi_set_config failed: %s", esp_err_to_name(err));
    return core::Err(err);
  }
  return core::Ok();
}

core::Status
EspConnectivity::start_association(const NetworkSpecifier &specifier) {
  if (auto err = esp_wifi_disconnect();
      err != ESP_OK && err != ESP_ERR_WIFI_NOT_CONNECT) {
    ESP_LOGW(TAG, "esp_wifi_disconnect: %s", esp_err_to_name(err));
  }

  if (auto err = apply_station_config(specifier); !err) {
    return err;
  }

  if (auto err = esp_wifi_connect(); err != ESP_OK) {
    ESP_LOGE(TAG, "esp_wifi_connect failed: %s", esp_err_to_name(err));
    return core::Err(err);
  }
  return core::Ok();
}

core::Result<RegistrationId>
EspConnectivity::request_network(const NetworkRequest &request,
                                 EventHandler handler,
                                 std::chrono::milliseconds timeout) {
  core::LockGuard lock(mutex_);
  if (!initialized_) {
    return core::Err(ESP_ERR_INVALID_STATE);
  }

  if (active_) {
    ESP_LOGW(TAG, "Request %" PRIu32 " replaced", active_->id);
    active_.reset();
  }
  enabled_stored_.reset();
  (void)timeout_timer_.stop();

  if (auto err = start_association(request.specifier); !err) {
    return core::Err(err.error());
  }

  RegistrationId id = next_registration_++;
  active_ = ActiveRequest{
      .id = id,
      .request = request,
      .handler = std::move(handler),
  };

  if (timeout.count() > 0) {
    if (auto err = timeout_timer_.start(timeout); !err) {
      ESP_LOGW(TAG, "Request timeout not armed: %s",
               esp_err_to_name(err.error()));
    }
  }

  ESP_LOGI(TAG, "Request %" PRIu32 " for '%s' (timeout %lld ms)", id,
           request.specifier.ssid.c_str(),
           static_cast<long long>(timeout.count()));
  return id;
}

core::Status EspConnectivity::unregister_network_callback(RegistrationId id) {
  core::LockGuard lock(mutex_);
  if (!active_ || active_->id != id) {
    return core::Err(ESP_ERR_NOT_FOUND);
  }

  (void)timeout_timer_.stop();
  active_.reset();
  if (auto err = esp_wifi_disconnect();
      err != ESP_OK && err != ESP_ERR_WIFI_NOT_CONNECT) {
    ESP_LOGW(TAG, "esp_wifi_disconnect: %s", esp_err_to_name(err));
  }
  ESP_LOGD(TAG, "Request %" PRIu32 " unregistered", id);
  return core::Ok();
}

core::Status
EspConnectivity::bind_process_to_network(std::optional<NetworkHandle> network) {
  core::LockGuard lock(mutex_);
  if (network) {
    if (!bound_) {
      previous_default_ = esp_netif_get_default_netif();
    }
    if (auto err = esp_netif_set_default_netif(netif_); err != ESP_OK) {
      ESP_LOGE(TAG, "Failed to set default netif: %s", esp_err_to_name(err));
      return core::Err(err);
    }
    bound_ = network;
    ESP_LOGI(TAG, "Traffic bound to network %" PRIu32, network->id);
    return core::Ok();
  }

  if (bound_ && previous_default_ != nullptr && previous_default_ != netif_) {
    if (auto err = esp_netif_set_default_netif(previous_default_);
        err != ESP_OK) {
      ESP_LOGW(TAG, "Failed to restore default netif: %s",
               esp_err_to_name(err));
    }
  }
  previous_default_ = nullptr;
  bound_.reset();
  ESP_LOGD(TAG, "Traffic binding cleared");
  return core::Ok();
}

std::optional<NetworkHandle> EspConnectivity::bound_network() const {
  core::LockGuard lock(mutex_);
  return bound_;
}

core::Result<NetworkHandle>
EspConnectivity::add_configured_network(const ConfiguredNetwork &network) {
  if (network.ssid.empty() || network.ssid.size() > kMaxSsidLen) {
    return core::Err(ESP_ERR_INVALID_ARG);
  }

  core::LockGuard lock(mutex_);
  NetworkHandle handle{next_network_++};
  stored_.push_back({.handle = handle, .config = network});
  ESP_LOGD(TAG, "Stored configuration %" PRIu32 " for '%s'", handle.id,
           network.ssid.c_str());
  return handle;
}

core::Status EspConnectivity::enable_configured_network(NetworkHandle network) {
  core::LockGuard lock(mutex_);
  if (!initialized_) {
    return core::Err(ESP_ERR_INVALID_STATE);
  }

  auto it = std::find_if(stored_.begin(), stored_.end(),
                         [&](const auto &s) { return s.handle == network; });
  if (it == stored_.end()) {
    return core::Err(ESP_ERR_NOT_FOUND);
  }

  if (active_) {
    ESP_LOGW(TAG, "Request %" PRIu32 " dropped for stored configuration",
             active_->id);
    active_.reset();
    (void)timeout_timer_.stop();
  }

  NetworkSpecifier specifier{
      .ssid = it->config.ssid,
      .passphrase = it->config.passphrase,
  };
  if (auto err = start_association(specifier); !err) {
    return err;
  }
  enabled_stored_ = network;
  return core::Ok();
}

core::Status
EspConnectivity::disable_configured_network(NetworkHandle network) {
  core::LockGuard lock(mutex_);
  auto it = std::find_if(stored_.begin(), stored_.end(),
                         [&](const auto &s) { return s.handle == network; });
  if (it == stored_.end()) {
    return core::Err(ESP_ERR_NOT_FOUND);
  }
  stored_.erase(it);

  if (enabled_stored_ == network) {
    enabled_stored_.reset();
    if (auto err = esp_wifi_disconnect();
        err != ESP_OK && err != ESP_ERR_WIFI_NOT_CONNECT) {
      ESP_LOGW(TAG, "esp_wifi_disconnect: %s", esp_err_to_name(err));
    }
  }
  return core::Ok();
}

std::optional<std::string> EspConnectivity::current_ssid() const {
  wifi_ap_record_t ap_info{};
  if (esp_wifi_sta_get_ap_info(&ap_info) != ESP_OK) {
    return std::nullopt;
  }
  const auto *ssid = reinterpret_cast<const char *>(ap_info.ssid);
  return std::string(ssid, strnlen(ssid, sizeof(ap_info.ssid)));
}

std::optional<uint32_t> EspConnectivity::current_ipv4() const {
  if (netif_ == nullptr) {
    return std::nullopt;
  }
  esp_netif_ip_info_t info{};
  if (esp_netif_get_ip_info(netif_, &info) != ESP_OK) {
    return std::nullopt;
  }
  return info.ip.addr;
}

EspConnectivity::Delivery EspConnectivity::fail_active_locked() {
  Delivery delivery{std::move(active_->handler),
                    PlatformEvent{.type = PlatformEventType::Unavailable}};
  (void)timeout_timer_.stop();
  active_.reset();
  return delivery;
}

void EspConnectivity::on_wifi_event(int32_t event_id, void *event_data) {
  std::optional<Delivery> delivery;
  {
    core::LockGuard lock(mutex_);
    switch (event_id) {
    case WIFI_EVENT_STA_CONNECTED:
      ESP_LOGI(TAG, "Associated");
      break;

    case WIFI_EVENT_STA_DISCONNECTED: {
      auto *info = static_cast<wifi_event_sta_disconnected_t *>(event_data);
      ESP_LOGW(TAG, "Disconnected, reason: %d", info->reason);
      if (!active_) {
        break;
      }

      if (active_->available) {
        active_->available = false;
        delivery = Delivery{active_->handler,
                            PlatformEvent{
                                .type = PlatformEventType::Lost,
                                .network = active_->network,
                            }};
        reconnect();
      } else if (is_terminal_reason(info->reason)) {
        delivery = fail_active_locked();
      } else {
        reconnect();
      }
      break;
    }

    case WIFI_EVENT_STA_BSS_RSSI_LOW:
      if (active_ && active_->available) {
        delivery = Delivery{active_->handler,
                            PlatformEvent{
                                .type = PlatformEventType::Losing,
                                .network = active_->network,
                            }};
      }
      break;

    default:
      break;
    }
  }
  deliver(std::move(delivery));
}

void EspConnectivity::on_ip_event(int32_t event_id, void *event_data) {
  if (event_id != IP_EVENT_STA_GOT_IP) {
    return;
  }
  auto *info = static_cast<ip_event_got_ip_t *>(event_data);
  ESP_LOGI(TAG, "Got IP: " IPSTR, IP2STR(&info->ip_info.ip));

  std::optional<Delivery> delivery;
  {
    core::LockGuard lock(mutex_);
    if (!active_ || active_->available) {
      return;
    }

    if (active_->request.internet && info->ip_info.gw.addr == 0) {
      ESP_LOGW(TAG, "No gateway, internet capability not satisfied");
      delivery = fail_active_locked();
    } else {
      (void)timeout_timer_.stop();
      active_->available = true;
      active_->network = NetworkHandle{next_network_++};
      if (auto err = esp_wifi_set_rssi_threshold(kLosingRssiDbm);
          err != ESP_OK) {
        ESP_LOGW(TAG, "esp_wifi_set_rssi_threshold: %s", esp_err_to_name(err));
      }
      delivery = Delivery{active_->handler,
                          PlatformEvent{
                              .type = PlatformEventType::Available,
                              .network = active_->network,
                          }};
    }
  }
  deliver(std::move(delivery));
}

void EspConnectivity::on_timeout() {
  std::optional<Delivery> delivery;
  {
    core::LockGuard lock(mutex_);
    if (!active_ || active_->available) {
      return;
    }
    ESP_LOGW(TAG, "Request %" PRIu32 " timed out", active_->id);
    delivery = fail_active_locked();
    esp_wifi_disconnect();
  }
  deliver(std::move(delivery));
}

void EspConnectivity::deliver(std::optional<Delivery> delivery) {
  if (delivery && delivery->first) {
    delivery->first(delivery->second);
  }
}

void EspConnectivity::wifi_event_handler(void *arg, esp_event_base_t /*base*/,
                                         int32_t event_id, void *event_data) {
  static_cast<EspConnectivity *>(arg)->on_wifi_event(event_id, event_data);
}

void EspConnectivity::ip_event_handler(void *arg, esp_event_base_t /*base*/,
                                       int32_t event_id, void *event_data) {
  static_cast<EspConnectivity *>(arg)->on_ip_event(event_id, event_data);
}

} // namespace network
