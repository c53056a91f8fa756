/**
 * @file event_channel.hpp
 * @brief Message channel over the default event loop
 *
 * Frames travel as BRIDGE_EVENTS payloads: a 32-bit length followed by the
 * encoded bytes. A transport task (UART, BLE, ...) posts CallFrame events
 * and forwards ReplyFrame/StreamFrame events to the host.
 */

#pragma once

#include "channel.hpp"

#include <core/event_loop.hpp>
#include <core/result.hpp>

#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace bridge {

CORE_EVENT_DECLARE_BASE(BRIDGE_EVENTS);

enum class BridgeEvent : int32_t {
  CallFrame,
  ReplyFrame,
  StreamFrame,
};

/// Length-prefixed copy of frame, ready to post
[[nodiscard]] std::vector<uint8_t> pack_frame(std::span<const uint8_t> frame);

/// View of a posted frame (event_data of a BRIDGE_EVENTS handler)
[[nodiscard]] std::span<const uint8_t> unpack_frame(const void *event_data);

class EventBusChannel final : public IMessageChannel {
public:
  using CallHandler = std::function<void(std::span<const uint8_t>)>;

  EventBusChannel() = default;

  EventBusChannel(const EventBusChannel &) = delete;
  EventBusChannel &operator=(const EventBusChannel &) = delete;

  /// Deliver incoming CallFrame events to on_call (on the event loop task)
  [[nodiscard]] core::Status start(CallHandler on_call);

  void stop() { call_sub_.unsubscribe(); }

  [[nodiscard]] core::Status send(FrameKind kind,
                                  std::span<const uint8_t> frame) override;

  /// Inject an incoming call frame
  [[nodiscard]] static core::Status post_call(std::span<const uint8_t> frame);

private:
  static void call_event_handler(void *arg, esp_event_base_t base,
                                 int32_t event_id, void *event_data);

  CallHandler on_call_;
  core::EventSubscription call_sub_;
};

} // namespace bridge
