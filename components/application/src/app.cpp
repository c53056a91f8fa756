/**
 * @file app.cpp
 * @brief WiFi link bridge application implementation
 */

#include <application/app.hpp>

#include "app_config.hpp"

#include <network/network_info.hpp>

#include <esp_app_desc.h>
#include <esp_log.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace application {

BridgeApp::BridgeApp(const BridgeAppConfig &config)
    : config_(config),
      controller_(connectivity_,
                  network::AssociationConfig{
                      .default_timeout = config.connect_timeout,
                  }),
      scanner_(scan_platform_),
      plugin_(controller_, scanner_, connectivity_,
              bridge::PluginConfig{
                  .default_timeout = config.connect_timeout,
                  .scan_stream = config.scan_stream,
              }) {}

core::Status BridgeApp::run() {
  log_boot_info();

  if (auto err = init_platform_adapters(); !err) {
    return err;
  }

  controller_.on_state_change(
      [this](network::AssociationState from, network::AssociationState to) {
        on_association_state(from, to);
      });

  if (auto err = init_channel(); !err) {
    return err;
  }

  ESP_LOGI(TAG, "Startup complete (backends: network-request=%s, "
                "configured-network=%s)",
           controller_.has_backend(network::BackendKind::NetworkRequest)
               ? "yes"
               : "no",
           controller_.has_backend(network::BackendKind::ConfiguredNetwork)
               ? "yes"
               : "no");

  // All work happens on the event loop; this task only reports status
  while (true) {
    vTaskDelay(pdMS_TO_TICKS(
        std::chrono::milliseconds(config_.status_interval).count()));
    log_status();
  }
}

void BridgeApp::log_boot_info() {
  const auto *app_desc = esp_app_get_description();
  ESP_LOGI(TAG, "%s v%s (config %s)", app_desc->project_name,
           app_desc->version, app::config::FIRMWARE_VERSION);
}

core::Status BridgeApp::init_platform_adapters() {
  if (auto err = connectivity_.init(); !err) {
    ESP_LOGE(TAG, "WiFi init failed: %s", esp_err_to_name(err.error()));
    return err;
  }
  if (auto err = scan_platform_.init(); !err) {
    ESP_LOGE(TAG, "Scan init failed: %s", esp_err_to_name(err.error()));
    return err;
  }
  return core::Ok();
}

core::Status BridgeApp::init_channel() {
  plugin_.attach(channel_);
  if (auto err = channel_.start([this](std::span<const uint8_t> frame) {
        on_call_frame(frame);
      });
      !err) {
    ESP_LOGE(TAG, "Channel start failed: %s", esp_err_to_name(err.error()));
    return err;
  }
  return core::Ok();
}

void BridgeApp::on_association_state(network::AssociationState from,
                                     network::AssociationState to) {
  ESP_LOGI(TAG, "Association: %s -> %s", network::to_string(from),
           network::to_string(to));
}

void BridgeApp::on_call_frame(std::span<const uint8_t> frame) {
  ESP_LOGD(TAG, "Call frame (%zu bytes)", frame.size());
  plugin_.on_call_frame(frame);
}

void BridgeApp::log_status() const {
  auto ssid = network::current_ssid(connectivity_);
  auto ip = network::current_ip(connectivity_);
  ESP_LOGI(TAG, "State %s | SSID %s | IP %s | stream %s",
           network::to_string(controller_.state()),
           ssid ? ssid->c_str() : "-", ip ? ip->c_str() : "-",
           plugin_.listening() ? "open" : "closed");
}

} // namespace application
