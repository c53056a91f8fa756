/**
 * @file event_loop.hpp
 * @brief RAII wrapper for ESP-IDF default event loop
 */

#pragma once

#include "result.hpp"

#include <esp_event.h>

#include <atomic>
#include <cstdint>
#include <type_traits>

namespace core {

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define CORE_EVENT_DEFINE_BASE(name) ESP_EVENT_DEFINE_BASE(name)
#define CORE_EVENT_DECLARE_BASE(name) ESP_EVENT_DECLARE_BASE(name)
// NOLINTEND(cppcoreguidelines-macro-usage)

/// Valid event ID types (enum or integral)
template <typename T>
concept EventId = std::is_enum_v<T> || std::is_integral_v<T>;

/// RAII event handler registration (auto-unsubscribes)
class EventSubscription {
public:
  EventSubscription() = default;

  EventSubscription(esp_event_base_t base, int32_t event_id,
                    esp_event_handler_instance_t instance)
      : base_(base), id_(event_id), instance_(instance) {}

  ~EventSubscription() { unsubscribe(); }

  EventSubscription(const EventSubscription &) = delete;
  EventSubscription &operator=(const EventSubscription &) = delete;

  EventSubscription(EventSubscription &&other) noexcept
      : base_(other.base_), id_(other.id_), instance_(other.instance_) {
    other.instance_ = nullptr;
  }

  EventSubscription &operator=(EventSubscription &&other) noexcept {
    if (this != &other) {
      unsubscribe();
      base_ = other.base_;
      id_ = other.id_;
      instance_ = other.instance_;
      other.instance_ = nullptr;
    }
    return *this;
  }

  void unsubscribe() {
    if (instance_ != nullptr) {
      (void)esp_event_handler_instance_unregister(base_, id_, instance_);
      instance_ = nullptr;
    }
  }

  [[nodiscard]] bool active() const { return instance_ != nullptr; }
  [[nodiscard]] explicit operator bool() const { return active(); }

private:
  esp_event_base_t base_ = nullptr;
  int32_t id_ = 0;
  esp_event_handler_instance_t instance_ = nullptr;
};

/// Event bus over the ESP-IDF default event loop
class EventBus {
public:
  /// Create the default loop (an already existing loop is fine)
  static Status initialize() {
    esp_err_t err = esp_event_loop_create_default();
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
      return Err(err);
    }
    get().ready_.store(true);
    return Ok();
  }

  static EventBus &get() {
    static EventBus bus;
    return bus;
  }

  EventBus(const EventBus &) = delete;
  EventBus &operator=(const EventBus &) = delete;
  EventBus(EventBus &&) = delete;
  EventBus &operator=(EventBus &&) = delete;

  /// Subscribe to events; an inactive subscription is returned on failure
  template <EventId Evt>
  [[nodiscard]] EventSubscription subscribe(esp_event_base_t base, Evt event_id,
                                            esp_event_handler_t handler,
                                            void *arg = nullptr) {
    esp_event_handler_instance_t inst = nullptr;
    esp_err_t err = esp_event_handler_instance_register(
        base, static_cast<int32_t>(event_id), handler, arg, &inst);
    if (err != ESP_OK) {
      return {};
    }
    return {base, static_cast<int32_t>(event_id), inst};
  }

  /// Publish an event with a payload copied into the loop queue
  template <EventId Evt>
  [[nodiscard]] Status publish(esp_event_base_t base, Evt event_id,
                               const void *data, size_t size,
                               TickType_t timeout = portMAX_DELAY) {
    if (!ready_.load()) {
      return Err(ESP_ERR_INVALID_STATE);
    }
    return Status::from(esp_event_post(base, static_cast<int32_t>(event_id),
                                       data, size, timeout));
  }

private:
  EventBus() = default;
  ~EventBus() = default;

  std::atomic<bool> ready_{false};
};

inline EventBus &events() { return EventBus::get(); }

} // namespace core
