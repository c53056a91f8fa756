/**
 * @file esp_scan_platform.cpp
 * @brief EspScanPlatform implementation
 */

#include "network/esp_scan_platform.hpp"

#include "network/mac_address.hpp"

#include <esp_log.h>
#include <esp_timer.h>

#include <array>
#include <cstring>

namespace network {

namespace {
constexpr const char *TAG = "esp_scan";

const char *capabilities_for(wifi_auth_mode_t mode) {
  switch (mode) {
  case WIFI_AUTH_OPEN:
    return "[ESS]";
  case WIFI_AUTH_WEP:
    return "[WEP][ESS]";
  case WIFI_AUTH_WPA_PSK:
    return "[WPA-PSK][ESS]";
  case WIFI_AUTH_WPA2_PSK:
    return "[WPA2-PSK][ESS]";
  case WIFI_AUTH_WPA_WPA2_PSK:
    return "[WPA-PSK][WPA2-PSK][ESS]";
  case WIFI_AUTH_WPA2_ENTERPRISE:
    return "[WPA2-EAP][ESS]";
  case WIFI_AUTH_WPA3_PSK:
    return "[SAE][ESS]";
  case WIFI_AUTH_WPA2_WPA3_PSK:
    return "[WPA2-PSK][SAE][ESS]";
  default:
    return "[ESS]";
  }
}

WifiStandard standard_for(const wifi_ap_record_t &record) {
  if (record.phy_11ax) {
    return WifiStandard::Ax;
  }
  if (record.phy_11n) {
    return WifiStandard::N;
  }
  if (record.phy_11b || record.phy_11g) {
    return WifiStandard::Legacy;
  }
  return WifiStandard::Unknown;
}

} // namespace

core::Status EspScanPlatform::init() {
  scan_sub_ = core::events().subscribe(WIFI_EVENT, WIFI_EVENT_SCAN_DONE,
                                       scan_event_handler, this);
  if (!scan_sub_) {
    ESP_LOGE(TAG, "Failed to subscribe to scan events");
    return core::Err(ESP_FAIL);
  }
  return core::Ok();
}

ScanReadiness EspScanPlatform::can_start_scan(bool /*ask_permissions*/) {
  wifi_mode_t mode = WIFI_MODE_NULL;
  if (auto err = esp_wifi_get_mode(&mode); err != ESP_OK) {
    ESP_LOGW(TAG, "WiFi not ready: %s", esp_err_to_name(err));
    return ScanReadiness::NotSupported;
  }
  return (mode == WIFI_MODE_STA || mode == WIFI_MODE_APSTA)
             ? ScanReadiness::Yes
             : ScanReadiness::NotSupported;
}

core::Status EspScanPlatform::start_scan() {
  wifi_scan_config_t config{};
  config.show_hidden = true;
  if (auto err = esp_wifi_scan_start(&config, false); err != ESP_OK) {
    ESP_LOGE(TAG, "esp_wifi_scan_start failed: %s", esp_err_to_name(err));
    return core::Err(err);
  }
  ESP_LOGD(TAG, "Scan started");
  return core::Ok();
}

ScanReadiness EspScanPlatform::can_get_scanned_results(bool ask_permissions) {
  return can_start_scan(ask_permissions);
}

std::vector<AccessPoint> EspScanPlatform::scanned_results() const {
  core::LockGuard lock(mutex_);
  return cache_;
}

void EspScanPlatform::set_results_handler(ResultsHandler handler) {
  core::LockGuard lock(mutex_);
  handler_ = std::move(handler);
}

AccessPoint EspScanPlatform::to_access_point(const wifi_ap_record_t &record,
                                             int64_t timestamp_us) {
  const auto *ssid = reinterpret_cast<const char *>(record.ssid);

  AccessPoint ap{
      .ssid = std::string(ssid, strnlen(ssid, sizeof(record.ssid))),
      .bssid = MacAddress::from_raw(record.bssid).to_string(),
      .capabilities = capabilities_for(record.authmode),
      .frequency_mhz = channel_to_frequency(record.primary),
      .level_dbm = record.rssi,
      .timestamp_us = timestamp_us,
      .standard = standard_for(record),
  };

  ap.center_frequency0_mhz = ap.frequency_mhz;
  switch (record.second) {
  case WIFI_SECOND_CHAN_ABOVE:
    ap.channel_width = ChannelWidth::Mhz40;
    ap.center_frequency0_mhz = ap.frequency_mhz + 10;
    break;
  case WIFI_SECOND_CHAN_BELOW:
    ap.channel_width = ChannelWidth::Mhz40;
    ap.center_frequency0_mhz = ap.frequency_mhz - 10;
    break;
  default:
    ap.channel_width = ChannelWidth::Mhz20;
    break;
  }
  return ap;
}

void EspScanPlatform::on_scan_done(const wifi_event_sta_scan_done_t &done) {
  ResultsHandler handler;
  {
    core::LockGuard lock(mutex_);
    handler = handler_;
  }

  if (done.status != 0) {
    ESP_LOGW(TAG, "Scan failed (status %u)",
             static_cast<unsigned>(done.status));
    esp_wifi_clear_ap_list();
    if (handler) {
      handler(core::Err(ESP_FAIL));
    }
    return;
  }

  std::array<wifi_ap_record_t, kMaxRecords> records{};
  auto count = static_cast<uint16_t>(records.size());
  if (auto err = esp_wifi_scan_get_ap_records(&count, records.data());
      err != ESP_OK) {
    ESP_LOGE(TAG, "esp_wifi_scan_get_ap_records failed: %s",
             esp_err_to_name(err));
    if (handler) {
      handler(core::Err(err));
    }
    return;
  }

  const int64_t now = esp_timer_get_time();
  std::vector<AccessPoint> results;
  results.reserve(count);
  for (uint16_t i = 0; i < count; ++i) {
    results.push_back(to_access_point(records.at(i), now));
  }

  ESP_LOGI(TAG, "Scan done: %u record(s)", static_cast<unsigned>(count));
  {
    core::LockGuard lock(mutex_);
    cache_ = results;
  }
  if (handler) {
    handler(std::move(results));
  }
}

void EspScanPlatform::scan_event_handler(void *arg, esp_event_base_t /*base*/,
                                         int32_t /*event_id*/,
                                         void *event_data) {
  auto *self = static_cast<EspScanPlatform *>(arg);
  self->on_scan_done(*static_cast<wifi_event_sta_scan_done_t *>(event_data));
}

} // namespace network
