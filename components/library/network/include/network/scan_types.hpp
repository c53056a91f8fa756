/**
 * @file scan_types.hpp
 * @brief Access point records and the scan platform interface
 */

#pragma once

#include <core/result.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace network {

/// Whether scanning (or reading results) is possible; values are wire codes
enum class ScanReadiness : int32_t {
  NotSupported = 0,
  Yes = 1,
  NoLocationPermissionRequired = 2,
  NoLocationPermissionDenied = 3,
  NoLocationPermissionUpgradeAccuracy = 4,
  NoLocationServiceDisabled = 5,
  Failed = 6,
};

[[nodiscard]] constexpr int32_t to_code(ScanReadiness readiness) {
  return static_cast<int32_t>(readiness);
}

/// 802.11 generation; values are wire codes
enum class WifiStandard : int32_t {
  Unknown = 0,
  Legacy = 1,
  N = 4,
  Ac = 5,
  Ax = 6,
  Ad = 7,
  Be = 8,
};

/// Channel bandwidth; values are wire codes
enum class ChannelWidth : int32_t {
  Mhz20 = 0,
  Mhz40 = 1,
  Mhz80 = 2,
  Mhz160 = 3,
  Mhz80Plus80 = 4,
  Mhz320 = 5,
};

/// One scan result
struct AccessPoint {
  std::string ssid;
  std::string bssid;

  /// Authentication/key management summary, e.g. "[WPA2-PSK]"
  std::string capabilities;

  int32_t frequency_mhz = 0;
  int32_t level_dbm = 0;

  /// Time the record was seen, microseconds since boot
  int64_t timestamp_us = 0;

  WifiStandard standard = WifiStandard::Unknown;
  int32_t center_frequency0_mhz = 0;
  ChannelWidth channel_width = ChannelWidth::Mhz20;
};

/// Center frequency of a 2.4/5 GHz channel number (0 if unknown)
[[nodiscard]] constexpr int32_t channel_to_frequency(int32_t channel) {
  if (channel >= 1 && channel <= 13) {
    return 2407 + 5 * channel;
  }
  if (channel == 14) {
    return 2484;
  }
  if (channel >= 36 && channel <= 177) {
    return 5000 + 5 * channel;
  }
  return 0;
}

/// Platform scanning facility
class IScanPlatform {
public:
  using ResultsHandler =
      std::function<void(const core::Result<std::vector<AccessPoint>> &)>;

  virtual ~IScanPlatform() = default;

  [[nodiscard]] virtual ScanReadiness can_start_scan(bool ask_permissions) = 0;

  /// Trigger a scan; results are reported through the results handler
  [[nodiscard]] virtual core::Status start_scan() = 0;

  [[nodiscard]] virtual ScanReadiness
  can_get_scanned_results(bool ask_permissions) = 0;

  /// Latest cached results
  [[nodiscard]] virtual std::vector<AccessPoint> scanned_results() const = 0;

  /// Install the single handler for new results or scan errors
  virtual void set_results_handler(ResultsHandler handler) = 0;
};

} // namespace network
