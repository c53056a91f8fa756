/**
 * @file wifi_types.hpp
 * @brief Association type definitions and constants
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace network {

/// Maximum lengths for WiFi credentials (802.11 limits)
inline constexpr size_t kMaxSsidLen = 32;
inline constexpr size_t kMaxPasswordLen = 64;

/// Default association settings
namespace defaults {
inline constexpr std::chrono::seconds REQUEST_TIMEOUT{30};
} // namespace defaults

/// Key management used with a credential
enum class SecurityMode : uint8_t {
  Psk,         ///< WPA2 personal
  Sae,         ///< WPA3 personal
  Unspecified, ///< Caller did not say; treated as Psk
};

/// Parse the wire name of a security mode ("WPA2_PSK", "WPA3_SAE")
[[nodiscard]] constexpr SecurityMode parse_security_mode(std::string_view name) {
  if (name == "WPA2_PSK") {
    return SecurityMode::Psk;
  }
  if (name == "WPA3_SAE") {
    return SecurityMode::Sae;
  }
  return SecurityMode::Unspecified;
}

[[nodiscard]] constexpr std::string_view
security_mode_to_string(SecurityMode mode) {
  switch (mode) {
  case SecurityMode::Psk:
    return "WPA2_PSK";
  case SecurityMode::Sae:
    return "WPA3_SAE";
  default:
    return "UNSPECIFIED";
  }
}

/// Immutable description of the network a caller wants to join
struct ConnectionIntent {
  /// Advertised network name (required, non-empty)
  std::string ssid;

  /// Optional access point hardware address ("aa:bb:cc:dd:ee:ff")
  std::optional<std::string> bssid;

  /// Optional passphrase, interpreted per security mode
  std::optional<std::string> password;

  SecurityMode security = SecurityMode::Psk;

  /// Require general internet reachability (false explicitly forgoes it)
  bool requires_internet = false;

  /// Best effort; ignored by backends without timeout support
  std::chrono::milliseconds timeout{defaults::REQUEST_TIMEOUT};

  /// Use the configured-network path even if network requests are available
  bool force_compat = false;
};

/// Controller session states
enum class AssociationState : uint8_t {
  Idle,       ///< No outstanding request
  Requesting, ///< Request issued, waiting for the platform
  Bound,      ///< Network available, process traffic bound to it
  Failed,     ///< Platform reported the network unavailable
};

[[nodiscard]] constexpr const char *to_string(AssociationState state) {
  switch (state) {
  case AssociationState::Idle:
    return "idle";
  case AssociationState::Requesting:
    return "requesting";
  case AssociationState::Bound:
    return "bound";
  case AssociationState::Failed:
    return "failed";
  default:
    return "?";
  }
}

/// Opaque platform reference to an active network (0 is never valid)
struct NetworkHandle {
  uint32_t id = 0;

  bool operator==(const NetworkHandle &) const = default;
};

/// Identity of one callback registration with the platform
using RegistrationId = uint32_t;
inline constexpr RegistrationId kNoRegistration = 0;

} // namespace network
