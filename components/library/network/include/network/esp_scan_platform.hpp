/**
 * @file esp_scan_platform.hpp
 * @brief IScanPlatform over esp_wifi scanning
 */

#pragma once

#include "scan_types.hpp"

#include <core/event_loop.hpp>
#include <core/mutex.hpp>
#include <core/result.hpp>

#include <esp_event.h>
#include <esp_wifi.h>

#include <cstddef>
#include <vector>

namespace network {

/// Scans asynchronously and caches the latest records. The WiFi driver must
/// already be started (EspConnectivity::init).
class EspScanPlatform final : public IScanPlatform {
public:
  /// Records kept per scan
  static constexpr size_t kMaxRecords = 20;

  EspScanPlatform() = default;
  ~EspScanPlatform() override = default;

  EspScanPlatform(const EspScanPlatform &) = delete;
  EspScanPlatform &operator=(const EspScanPlatform &) = delete;

  [[nodiscard]] core::Status init();

  [[nodiscard]] ScanReadiness can_start_scan(bool ask_permissions) override;

  [[nodiscard]] core::Status start_scan() override;

  [[nodiscard]] ScanReadiness
  can_get_scanned_results(bool ask_permissions) override;

  [[nodiscard]] std::vector<AccessPoint> scanned_results() const override;

  void set_results_handler(ResultsHandler handler) override;

  /// Convert a driver record
  [[nodiscard]] static AccessPoint to_access_point(
      const wifi_ap_record_t &record, int64_t timestamp_us);

private:
  void on_scan_done(const wifi_event_sta_scan_done_t &done);

  static void scan_event_handler(void *arg, esp_event_base_t base,
                                 int32_t event_id, void *event_data);

  mutable core::Mutex mutex_;
  std::vector<AccessPoint> cache_;
  ResultsHandler handler_;
  core::EventSubscription scan_sub_;
};

} // namespace network
