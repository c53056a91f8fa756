/**
 * @file main.cpp
 * @brief Application entry point
 */

#include "app_config.hpp"

#include <application/app.hpp>

#include <esp_log.h>

#include <memory>

namespace {
constexpr const char *TAG = "main";
} // namespace

extern "C" void app_main() {
  application::BridgeAppConfig config{
      .connect_timeout = app::config::CONNECT_TIMEOUT,
      .scan_stream = app::config::SCAN_STREAM,
      .status_interval = app::config::STATUS_LOG_INTERVAL,
  };

  // Application holds the controller and plugin state - keep it off the stack
  auto app = std::make_unique<application::BridgeApp>(config);

  if (auto err = app->start(); !err) {
    ESP_LOGE(TAG, "App failed: %s", esp_err_to_name(err.error()));
  }
}
