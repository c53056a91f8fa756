/**
 * @file event_channel.cpp
 * @brief EventBusChannel implementation
 */

#include "bridge/event_channel.hpp"

#include <esp_log.h>

#include <cstring>

namespace bridge {

CORE_EVENT_DEFINE_BASE(BRIDGE_EVENTS);

namespace {
constexpr const char *TAG = "bridge_chan";

/// Posting must not stall the caller if the loop queue is full
constexpr TickType_t kPostTimeout = pdMS_TO_TICKS(100);

core::Status post(BridgeEvent event, std::span<const uint8_t> frame) {
  auto packed = pack_frame(frame);
  auto err = core::events().publish(BRIDGE_EVENTS, event, packed.data(),
                                    packed.size(), kPostTimeout);
  if (!err) {
    ESP_LOGW(TAG, "Dropped %zu byte frame: %s", frame.size(),
             esp_err_to_name(err.error()));
  }
  return err;
}

} // namespace

std::vector<uint8_t> pack_frame(std::span<const uint8_t> frame) {
  auto length = static_cast<uint32_t>(frame.size());
  std::vector<uint8_t> packed(sizeof(length) + frame.size());
  std::memcpy(packed.data(), &length, sizeof(length));
  if (!frame.empty()) {
    std::memcpy(packed.data() + sizeof(length), frame.data(), frame.size());
  }
  return packed;
}

std::span<const uint8_t> unpack_frame(const void *event_data) {
  if (event_data == nullptr) {
    return {};
  }
  uint32_t length = 0;
  std::memcpy(&length, event_data, sizeof(length));
  return {static_cast<const uint8_t *>(event_data) + sizeof(length), length};
}

core::Status EventBusChannel::start(CallHandler on_call) {
  on_call_ = std::move(on_call);
  call_sub_ = core::events().subscribe(BRIDGE_EVENTS, BridgeEvent::CallFrame,
                                       call_event_handler, this);
  if (!call_sub_) {
    ESP_LOGE(TAG, "Failed to subscribe to call frames");
    return core::Err(ESP_FAIL);
  }
  return core::Ok();
}

core::Status EventBusChannel::send(FrameKind kind,
                                   std::span<const uint8_t> frame) {
  return post(kind == FrameKind::Reply ? BridgeEvent::ReplyFrame
                                       : BridgeEvent::StreamFrame,
              frame);
}

core::Status EventBusChannel::post_call(std::span<const uint8_t> frame) {
  return post(BridgeEvent::CallFrame, frame);
}

void EventBusChannel::call_event_handler(void *arg, esp_event_base_t /*base*/,
                                         int32_t /*event_id*/,
                                         void *event_data) {
  auto *self = static_cast<EventBusChannel *>(arg);
  if (self->on_call_) {
    self->on_call_(unpack_frame(event_data));
  }
}

} // namespace bridge
