/**
 * @file mac_address.cpp
 * @brief MacAddress implementation
 */

#include "network/mac_address.hpp"

#include <algorithm>
#include <cstdio>

namespace network {

namespace {

/// "xx:" per octet, minus the trailing colon
constexpr size_t kTextLength = MacAddress::kLength * 3 - 1;

constexpr int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

} // namespace

core::Result<MacAddress> MacAddress::parse(std::string_view text) {
  if (text.size() != kTextLength) {
    return core::Err(ESP_ERR_INVALID_ARG);
  }

  Bytes bytes{};
  for (size_t i = 0; i < kLength; ++i) {
    const size_t pos = i * 3;
    if (i > 0 && text[pos - 1] != ':') {
      return core::Err(ESP_ERR_INVALID_ARG);
    }
    int hi = hex_value(text[pos]);
    int lo = hex_value(text[pos + 1]);
    if (hi < 0 || lo < 0) {
      return core::Err(ESP_ERR_INVALID_ARG);
    }
    bytes.at(i) = static_cast<uint8_t>((hi << 4) | lo);
  }

  return MacAddress(bytes);
}

MacAddress MacAddress::from_raw(const uint8_t *raw) {
  Bytes bytes{};
  std::copy_n(raw, kLength, bytes.begin());
  return MacAddress(bytes);
}

std::string MacAddress::to_string() const {
  std::array<char, kTextLength + 1> buf{};
  snprintf(buf.data(), buf.size(), "%02x:%02x:%02x:%02x:%02x:%02x", bytes_[0],
           bytes_[1], bytes_[2], bytes_[3], bytes_[4], bytes_[5]);
  return {buf.data(), kTextLength};
}

} // namespace network
