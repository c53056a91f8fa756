/**
 * @file timer.hpp
 * @brief RAII one-shot timer over esp_timer
 */

#pragma once

#include "result.hpp"

#include <esp_timer.h>

#include <chrono>
#include <functional>

namespace core {

/// Timer that fires once after a delay (callback runs on the esp_timer task)
class OneShotTimer {
public:
  using Callback = std::function<void()>;

  OneShotTimer(const char *name, Callback callback)
      : name_(name), callback_(std::move(callback)) {}

  ~OneShotTimer() {
    if (handle_ != nullptr) {
      (void)esp_timer_stop(handle_);
      (void)esp_timer_delete(handle_);
    }
  }

  OneShotTimer(const OneShotTimer &) = delete;
  OneShotTimer &operator=(const OneShotTimer &) = delete;
  OneShotTimer(OneShotTimer &&) = delete;
  OneShotTimer &operator=(OneShotTimer &&) = delete;

  /// Create the underlying esp_timer (must be called before start)
  [[nodiscard]] Status create() {
    if (handle_ != nullptr) {
      return Ok();
    }
    esp_timer_create_args_t args = {
        .callback = timer_callback,
        .arg = this,
        .dispatch_method = ESP_TIMER_TASK,
        .name = name_,
        .skip_unhandled_events = true,
    };
    return Status::from(esp_timer_create(&args, &handle_));
  }

  /// Start (or restart) the timer with the given delay
  template <typename Rep, typename Period>
  [[nodiscard]] Status start(std::chrono::duration<Rep, Period> delay) {
    if (handle_ == nullptr) {
      return Err(ESP_ERR_INVALID_STATE);
    }
    (void)stop();
    auto delay_us =
        std::chrono::duration_cast<std::chrono::microseconds>(delay).count();
    return Status::from(
        esp_timer_start_once(handle_, static_cast<uint64_t>(delay_us)));
  }

  /// Stop timer if running (stopping an idle timer is not an error)
  Status stop() {
    if (handle_ == nullptr) {
      return Ok();
    }
    esp_err_t err = esp_timer_stop(handle_);
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
      return Err(err);
    }
    return Ok();
  }

private:
  static void timer_callback(void *arg) {
    auto *self = static_cast<OneShotTimer *>(arg);
    if (self != nullptr && static_cast<bool>(self->callback_)) {
      self->callback_();
    }
  }

  const char *name_;
  esp_timer_handle_t handle_ = nullptr;
  Callback callback_;
};

} // namespace core
