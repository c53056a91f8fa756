/**
 * @file network_info.hpp
 * @brief Current network queries
 */

#pragma once

#include "connectivity.hpp"

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

namespace network {

/// Dotted-quad form of an IPv4 address packed little-endian (first octet in
/// the low byte, as lwIP stores it)
[[nodiscard]] inline std::string format_ipv4(uint32_t addr) {
  char buf[16];
  snprintf(buf, sizeof(buf), "%u.%u.%u.%u",
           static_cast<unsigned>(addr & 0xffU),
           static_cast<unsigned>((addr >> 8) & 0xffU),
           static_cast<unsigned>((addr >> 16) & 0xffU),
           static_cast<unsigned>((addr >> 24) & 0xffU));
  return buf;
}

[[nodiscard]] inline std::optional<std::string>
current_ssid(const IConnectivity &platform) {
  return platform.current_ssid();
}

/// Station address, or nullopt when unassigned (0.0.0.0)
[[nodiscard]] inline std::optional<std::string>
current_ip(const IConnectivity &platform) {
  auto addr = platform.current_ipv4();
  if (!addr || *addr == 0) {
    return std::nullopt;
  }
  return format_ipv4(*addr);
}

} // namespace network
