/**
 * @file wifi_scanner.cpp
 * @brief WifiScanner implementation
 */

#include "network/wifi_scanner.hpp"

#include <esp_log.h>

namespace network {

namespace {
constexpr const char *TAG = "scanner";
} // namespace

WifiScanner::WifiScanner(IScanPlatform &platform) : platform_(platform) {
  platform_.set_results_handler(
      [this](const core::Result<std::vector<AccessPoint>> &results) {
        dispatch(results);
      });
}

WifiScanner::~WifiScanner() { platform_.set_results_handler(nullptr); }

bool WifiScanner::start_scan() {
  if (auto err = platform_.start_scan(); !err) {
    ESP_LOGW(TAG, "Scan not started: %s", esp_err_to_name(err.error()));
    return false;
  }
  return true;
}

WifiScanner::Subscription WifiScanner::subscribe(IScanListener &listener) {
  core::LockGuard lock(mutex_);
  uint32_t id = next_id_++;
  listeners_.emplace(id, &listener);
  ESP_LOGD(TAG, "Listener %u subscribed", static_cast<unsigned>(id));
  return {this, id};
}

size_t WifiScanner::subscriber_count() const {
  core::LockGuard lock(mutex_);
  return listeners_.size();
}

void WifiScanner::unsubscribe(uint32_t id) {
  // Waits for a delivery in progress on another task
  core::LockGuard delivering(dispatch_mutex_);
  core::LockGuard lock(mutex_);
  listeners_.erase(id);
}

bool WifiScanner::is_subscribed(uint32_t id) const {
  core::LockGuard lock(mutex_);
  return listeners_.contains(id);
}

void WifiScanner::dispatch(
    const core::Result<std::vector<AccessPoint>> &results) {
  core::LockGuard delivering(dispatch_mutex_);

  std::map<uint32_t, IScanListener *> targets;
  {
    core::LockGuard lock(mutex_);
    if (results) {
      targets = listeners_;
    } else {
      // An error ends the stream for everyone
      targets.swap(listeners_);
    }
  }

  if (!results) {
    ESP_LOGE(TAG, "Scan failed: %s, closing %zu listener(s)",
             esp_err_to_name(results.error()), targets.size());
    for (auto &[id, listener] : targets) {
      listener->on_error(results.error());
    }
    return;
  }

  ESP_LOGI(TAG, "%zu access point(s) found", results->size());
  for (auto &[id, listener] : targets) {
    // An earlier listener may have unsubscribed this one
    if (is_subscribed(id)) {
      listener->on_results(*results);
    }
  }
}

} // namespace network
