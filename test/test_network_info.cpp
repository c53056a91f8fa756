/**
 * @file test_network_info.cpp
 * @brief Current-network queries and small conversions
 */

#include <doctest/doctest.h>

#include "fakes/fake_connectivity.hpp"

#include <network/network_info.hpp>
#include <network/scan_types.hpp>
#include <network/wifi_types.hpp>

// =============================================================================
// IPv4 formatting
// =============================================================================

TEST_CASE("IPv4 address packed little-endian") {
  // 192.168.1.42 as stored by lwIP on a little-endian target
  CHECK(network::format_ipv4(0x2A01A8C0U) == "192.168.1.42");
  CHECK(network::format_ipv4(0xFFFFFFFFU) == "255.255.255.255");
  CHECK(network::format_ipv4(0x0100007FU) == "127.0.0.1");
}

TEST_CASE("Current IP and SSID come from the platform") {
  test::FakeConnectivity fake;

  SUBCASE("unassociated") {
    CHECK_FALSE(network::current_ssid(fake).has_value());
    CHECK_FALSE(network::current_ip(fake).has_value());
  }
  SUBCASE("zero address means no address") {
    fake.set_current_ipv4(0);
    CHECK_FALSE(network::current_ip(fake).has_value());
  }
  SUBCASE("associated") {
    fake.set_current_ssid("Home");
    fake.set_current_ipv4(0x0A00000AU);
    CHECK(network::current_ssid(fake) == "Home");
    CHECK(network::current_ip(fake) == "10.0.0.10");
  }
}

// =============================================================================
// Security mode names
// =============================================================================

TEST_CASE("Security mode wire names") {
  using network::SecurityMode;
  CHECK(network::parse_security_mode("WPA2_PSK") == SecurityMode::Psk);
  CHECK(network::parse_security_mode("WPA3_SAE") == SecurityMode::Sae);
  CHECK(network::parse_security_mode("WPA2_EAP") == SecurityMode::Unspecified);
  CHECK(network::parse_security_mode("") == SecurityMode::Unspecified);
  CHECK(network::security_mode_to_string(SecurityMode::Sae) == "WPA3_SAE");
}

// =============================================================================
// Channel numbers
// =============================================================================

TEST_CASE("Channel to centre frequency") {
  CHECK(network::channel_to_frequency(1) == 2412);
  CHECK(network::channel_to_frequency(6) == 2437);
  CHECK(network::channel_to_frequency(13) == 2472);
  CHECK(network::channel_to_frequency(14) == 2484);
  CHECK(network::channel_to_frequency(36) == 5180);
  CHECK(network::channel_to_frequency(149) == 5745);
  CHECK(network::channel_to_frequency(0) == 0);
  CHECK(network::channel_to_frequency(20) == 0);
}
