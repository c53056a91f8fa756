/**
 * @file method.hpp
 * @brief Method-channel calls, replies and stream events
 */

#pragma once

#include <network/scan_types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bridge {

/// Methods understood by the WiFi plugin
enum class Method : uint8_t {
  Unknown = 0,
  CanStartScan,
  StartScan,
  CanGetScannedResults,
  GetScannedResults,
  Connect,
  Disconnect,
  GetCurrentSsid,
  GetCurrentIp,
  Listen,
  Cancel,
};

/// Convert wire name to method
[[nodiscard]] constexpr Method parse_method(std::string_view name) {
  if (name == "canStartScan") {
    return Method::CanStartScan;
  }
  if (name == "startScan") {
    return Method::StartScan;
  }
  if (name == "canGetScannedResults") {
    return Method::CanGetScannedResults;
  }
  if (name == "getScannedResults") {
    return Method::GetScannedResults;
  }
  if (name == "connect") {
    return Method::Connect;
  }
  if (name == "disconnect") {
    return Method::Disconnect;
  }
  if (name == "getCurrentSSID") {
    return Method::GetCurrentSsid;
  }
  if (name == "getCurrentIP") {
    return Method::GetCurrentIp;
  }
  if (name == "listen") {
    return Method::Listen;
  }
  if (name == "cancel") {
    return Method::Cancel;
  }
  return Method::Unknown;
}

/// Convert method to wire name
[[nodiscard]] constexpr std::string_view method_name(Method method) {
  switch (method) {
  case Method::CanStartScan:
    return "canStartScan";
  case Method::StartScan:
    return "startScan";
  case Method::CanGetScannedResults:
    return "canGetScannedResults";
  case Method::GetScannedResults:
    return "getScannedResults";
  case Method::Connect:
    return "connect";
  case Method::Disconnect:
    return "disconnect";
  case Method::GetCurrentSsid:
    return "getCurrentSSID";
  case Method::GetCurrentIp:
    return "getCurrentIP";
  case Method::Listen:
    return "listen";
  case Method::Cancel:
    return "cancel";
  default:
    return "unknown";
  }
}

struct PermissionArgs {
  bool ask_permissions = false;
};

struct ConnectArgs {
  std::string ssid;
  std::optional<std::string> password;
  std::string enterprise_certificate;
  std::optional<std::string> bssid;
  bool with_internet = false;
  int32_t timeout_in_seconds = 0;
  bool force_compat = false;
};

struct StreamArgs {
  std::string stream;
};

using MethodArgs =
    std::variant<std::monostate, PermissionArgs, ConnectArgs, StreamArgs>;

/// Incoming call
struct MethodCall {
  uint32_t id = 0;

  /// Wire name as received (kept for unknown methods)
  std::string name;

  Method method = Method::Unknown;
  MethodArgs args;
};

/// Error reply or stream error
struct ReplyError {
  std::string code;
  std::string message;
};

/// Reply for a method the plugin does not implement
struct NotImplemented {};

using AccessPoints = std::vector<network::AccessPoint>;

using ReplyValue =
    std::variant<std::monostate, bool, int32_t, std::string, AccessPoints,
                 ReplyError, NotImplemented>;

/// Outgoing reply to one call
struct MethodReply {
  uint32_t id = 0;
  ReplyValue value;
};

using StreamPayload = std::variant<AccessPoints, ReplyError>;

/// Outgoing stream element
struct StreamEvent {
  std::string stream;
  StreamPayload payload;
};

} // namespace bridge
