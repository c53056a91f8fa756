/**
 * @file codec.hpp
 * @brief nanopb encoding of method-channel messages
 *
 * Converts bridge::MethodCall/MethodReply/StreamEvent to and from the
 * bridge.proto wire format. Encoders fail with ESP_ERR_INVALID_SIZE when a
 * string exceeds its .options limit or the buffer is too small; decoders
 * fail with ESP_ERR_INVALID_ARG on malformed input.
 */

#pragma once

#include "method.hpp"

#include <core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

namespace bridge {

/// Largest encoded frames (from the generated size defines)
extern const size_t kMaxCallSize;
extern const size_t kMaxReplySize;
extern const size_t kMaxEventSize;

/// Access points carried per message; longer lists are truncated
extern const size_t kMaxAccessPoints;

[[nodiscard]] core::Result<MethodCall> decode_call(
    std::span<const uint8_t> buffer);

/// @return Number of bytes written
[[nodiscard]] core::Result<size_t> encode_call(const MethodCall &call,
                                               std::span<uint8_t> buffer);

[[nodiscard]] core::Result<size_t> encode_reply(const MethodReply &reply,
                                                std::span<uint8_t> buffer);

[[nodiscard]] core::Result<MethodReply> decode_reply(
    std::span<const uint8_t> buffer);

[[nodiscard]] core::Result<size_t> encode_event(const StreamEvent &event,
                                                std::span<uint8_t> buffer);

[[nodiscard]] core::Result<StreamEvent> decode_event(
    std::span<const uint8_t> buffer);

} // namespace bridge
