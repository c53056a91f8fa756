/**
 * @file pending_reply.hpp
 * @brief Completion that can be resolved at most once
 */

#pragma once

#include <functional>
#include <utility>

namespace network {

/// Caller's completion for one connect request. take() hands the callback
/// out exactly once; later calls return an empty function.
class PendingReply {
public:
  using Completion = std::function<void(bool)>;

  PendingReply() = default;
  explicit PendingReply(Completion completion)
      : completion_(std::move(completion)) {}

  PendingReply(const PendingReply &) = delete;
  PendingReply &operator=(const PendingReply &) = delete;
  PendingReply(PendingReply &&) noexcept = default;
  PendingReply &operator=(PendingReply &&) noexcept = default;

  /// Take the completion for invocation (empty if already resolved)
  [[nodiscard]] Completion take() {
    return std::exchange(completion_, nullptr);
  }

private:
  Completion completion_;
};

} // namespace network
