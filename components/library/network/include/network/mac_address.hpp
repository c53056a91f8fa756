/**
 * @file mac_address.hpp
 * @brief 48-bit hardware address parsing and formatting
 */

#pragma once

#include <core/result.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace network {

class MacAddress {
public:
  static constexpr size_t kLength = 6;
  using Bytes = std::array<uint8_t, kLength>;

  MacAddress() = default;
  explicit MacAddress(const Bytes &bytes) : bytes_(bytes) {}

  /// Parse colon-separated hex octets ("aa:bb:cc:dd:ee:ff", any case)
  /// @return ESP_ERR_INVALID_ARG on any other format
  [[nodiscard]] static core::Result<MacAddress> parse(std::string_view text);

  /// Build from a raw 6-byte buffer (e.g. wifi_ap_record_t::bssid)
  [[nodiscard]] static MacAddress from_raw(const uint8_t *raw);

  [[nodiscard]] const Bytes &bytes() const { return bytes_; }

  /// Lower-case colon-separated form
  [[nodiscard]] std::string to_string() const;

  bool operator==(const MacAddress &) const = default;

private:
  Bytes bytes_{};
};

} // namespace network
