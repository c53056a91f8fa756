/**
 * @file wifi_scanner.hpp
 * @brief Scan control and results stream
 */

#pragma once

#include "scan_types.hpp"

#include <core/mutex.hpp>
#include <core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

namespace network {

/// Receives scan results until unsubscribed or the stream is terminated
class IScanListener {
public:
  virtual ~IScanListener() = default;

  virtual void on_results(const std::vector<AccessPoint> &results) = 0;

  /// Scan failure; the subscription is closed after this call
  virtual void on_error(esp_err_t error) = 0;
};

class WifiScanner {
public:
  /// RAII listener registration
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription() { reset(); }

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    Subscription(Subscription &&other) noexcept
        : scanner_(other.scanner_), id_(other.id_) {
      other.scanner_ = nullptr;
    }

    Subscription &operator=(Subscription &&other) noexcept {
      if (this != &other) {
        reset();
        scanner_ = other.scanner_;
        id_ = other.id_;
        other.scanner_ = nullptr;
      }
      return *this;
    }

    void reset() {
      if (scanner_ != nullptr) {
        scanner_->unsubscribe(id_);
        scanner_ = nullptr;
      }
    }

    /// False once released or terminated by a scan error
    [[nodiscard]] bool active() const {
      return scanner_ != nullptr && scanner_->is_subscribed(id_);
    }

  private:
    friend class WifiScanner;
    Subscription(WifiScanner *scanner, uint32_t id)
        : scanner_(scanner), id_(id) {}

    WifiScanner *scanner_ = nullptr;
    uint32_t id_ = 0;
  };

  /// Installs itself as the platform's results handler
  explicit WifiScanner(IScanPlatform &platform);
  ~WifiScanner();

  WifiScanner(const WifiScanner &) = delete;
  WifiScanner &operator=(const WifiScanner &) = delete;
  WifiScanner(WifiScanner &&) = delete;
  WifiScanner &operator=(WifiScanner &&) = delete;

  [[nodiscard]] ScanReadiness can_start_scan(bool ask_permissions) {
    return platform_.can_start_scan(ask_permissions);
  }

  /// @return false if the platform refused to start a scan
  [[nodiscard]] bool start_scan();

  [[nodiscard]] ScanReadiness can_get_scanned_results(bool ask_permissions) {
    return platform_.can_get_scanned_results(ask_permissions);
  }

  [[nodiscard]] std::vector<AccessPoint> scanned_results() const {
    return platform_.scanned_results();
  }

  /// Listener must stay valid while the subscription is active
  [[nodiscard]] Subscription subscribe(IScanListener &listener);

  [[nodiscard]] size_t subscriber_count() const;

private:
  void unsubscribe(uint32_t id);
  [[nodiscard]] bool is_subscribed(uint32_t id) const;
  void dispatch(const core::Result<std::vector<AccessPoint>> &results);

  IScanPlatform &platform_;

  /// Held while listeners are called; unsubscribe() takes it so that a
  /// released listener is never called afterwards. Recursive so listeners
  /// may unsubscribe from inside a callback.
  core::RecursiveMutex dispatch_mutex_;

  mutable core::Mutex mutex_;
  std::map<uint32_t, IScanListener *> listeners_;
  uint32_t next_id_ = 1;
};

} // namespace network
