/**
 * @file app_config.hpp
 * @brief Build-time application configuration
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace app::config {

inline constexpr const char *FIRMWARE_VERSION = "1.0.0";

/// Applied to connect() calls without a positive timeoutInSeconds
inline constexpr std::chrono::seconds CONNECT_TIMEOUT{30};

/// Stream carrying scan results to the host
inline constexpr const char *SCAN_STREAM =
    "wifi_scan/onScannedResultsAvailable";

/// Period of the association status log line
inline constexpr std::chrono::seconds STATUS_LOG_INTERVAL{60};

} // namespace app::config
