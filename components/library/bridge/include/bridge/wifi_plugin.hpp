/**
 * @file wifi_plugin.hpp
 * @brief Method-channel front end for scanning and association
 *
 * Dispatches decoded calls to the scanner and the association controller
 * and produces exactly one reply per call. connect() replies
 * asynchronously, once the controller resolves. The scan results stream is
 * opened with "listen" and closed with "cancel" or by a scan error.
 */

#pragma once

#include "channel.hpp"
#include "method.hpp"

#include <core/mutex.hpp>
#include <core/result.hpp>

#include <network/association_controller.hpp>
#include <network/connectivity.hpp>
#include <network/wifi_scanner.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <span>
#include <string_view>

namespace bridge {

/// Plugin configuration
struct PluginConfig {
  /// Used when connect() carries no positive timeoutInSeconds
  std::chrono::seconds default_timeout{network::defaults::REQUEST_TIMEOUT};

  /// Name of the scan results stream
  std::string_view scan_stream = "wifi_scan/onScannedResultsAvailable";
};

/// Error codes carried in ReplyError::code
namespace errors {
inline constexpr std::string_view DECODE_FAILED = "DECODE_FAILED";
inline constexpr std::string_view INVALID_ARGS = "INVALID_ARGS";
inline constexpr std::string_view UNKNOWN_STREAM = "UNKNOWN_STREAM";
inline constexpr std::string_view SCAN_FAILED = "SCAN_FAILED";
} // namespace errors

class WifiPlugin final : public network::IScanListener {
public:
  using ReplySink = std::function<void(const MethodReply &)>;

  WifiPlugin(network::AssociationController &controller,
             network::WifiScanner &scanner, network::IConnectivity &platform,
             const PluginConfig &config = {});

  WifiPlugin(const WifiPlugin &) = delete;
  WifiPlugin &operator=(const WifiPlugin &) = delete;

  /// Channel for encoded replies and stream events (must outlive the plugin)
  void attach(IMessageChannel &channel);

  /// Handle one call; reply is invoked exactly once, possibly later and
  /// from another task
  void handle(const MethodCall &call, ReplySink reply);

  /// Decode and handle a call frame, replying over the attached channel
  void on_call_frame(std::span<const uint8_t> frame);

  [[nodiscard]] bool listening() const;

  void on_results(const std::vector<network::AccessPoint> &results) override;
  void on_error(esp_err_t error) override;

private:
  void handle_connect(const MethodCall &call, const ReplySink &reply);
  void handle_listen(const MethodCall &call, const ReplySink &reply);

  void send_reply(const MethodReply &reply);
  void send_event(const StreamEvent &event);

  network::AssociationController &controller_;
  network::WifiScanner &scanner_;
  network::IConnectivity &platform_;
  PluginConfig config_;

  IMessageChannel *channel_ = nullptr;

  mutable core::Mutex stream_mutex_;
  network::WifiScanner::Subscription subscription_;
};

} // namespace bridge
