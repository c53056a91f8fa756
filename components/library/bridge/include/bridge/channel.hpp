/**
 * @file channel.hpp
 * @brief Outgoing frame transport
 */

#pragma once

#include <core/result.hpp>

#include <cstdint>
#include <span>

namespace bridge {

enum class FrameKind : uint8_t {
  Reply,
  Event,
};

/// Carries encoded replies and stream events to the host application
class IMessageChannel {
public:
  virtual ~IMessageChannel() = default;

  [[nodiscard]] virtual core::Status send(FrameKind kind,
                                          std::span<const uint8_t> frame) = 0;
};

} // namespace bridge
