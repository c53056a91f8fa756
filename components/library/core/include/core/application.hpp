/**
 * @file application.hpp
 * @brief Application base class - owns platform bring-up
 */

#pragma once

#include "event_loop.hpp"
#include "result.hpp"

#include <nvs_flash.h>

namespace core {

/// Application base - derive and implement run()
class Application {
public:
  virtual ~Application() = default;

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;
  Application(Application &&) = delete;
  Application &operator=(Application &&) = delete;

  /// Initialize the platform and run the application
  [[nodiscard]] Status start() {
    if (auto err = init_platform(); !err) {
      return err;
    }
    return run();
  }

  /// Access event bus
  [[nodiscard]] static EventBus &events() { return EventBus::get(); }

protected:
  Application() = default;

  /// Override to implement application logic
  virtual Status run() = 0;

  /// Override to customize platform initialization
  virtual Status init_platform() {
    if (auto err = init_nvs(); !err) {
      return err;
    }
    return EventBus::initialize();
  }

  /// Initialize the NVS partition (the Wi-Fi driver keeps calibration there)
  static Status init_nvs() {
    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES ||
        err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
      if ((err = nvs_flash_erase()) != ESP_OK) {
        return Err(err);
      }
      err = nvs_flash_init();
    }
    return Status::from(err);
  }
};

} // namespace core
