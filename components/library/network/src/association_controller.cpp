/**
 * @file association_controller.cpp
 * @brief Association controller implementation
 */

#include "network/association_controller.hpp"

#include <esp_log.h>

#include <cinttypes>

namespace network {

namespace {
constexpr const char *TAG = "assoc";
} // namespace

AssociationController::AssociationController(IConnectivity &platform,
                                             const AssociationConfig &config)
    : platform_(platform), config_(config),
      backends_(detect_backends(platform)) {}

AssociationController::~AssociationController() { reset(); }

core::Result<NetworkRequest>
AssociationController::build_request(const ConnectionIntent &intent) {
  if (intent.ssid.empty() || intent.ssid.size() > kMaxSsidLen) {
    ESP_LOGE(TAG, "Invalid SSID length %zu", intent.ssid.size());
    return core::Err(ESP_ERR_INVALID_ARG);
  }

  NetworkRequest request{
      .transport = Transport::Wifi,
      .internet = intent.requires_internet,
      .specifier = {.ssid = intent.ssid},
  };

  if (intent.bssid) {
    if (intent.bssid->empty()) {
      ESP_LOGW(TAG, "Empty BSSID ignored");
    } else {
      auto mac = MacAddress::parse(*intent.bssid);
      if (!mac) {
        ESP_LOGE(TAG, "Malformed BSSID '%s'", intent.bssid->c_str());
        return core::Err(ESP_ERR_INVALID_ARG);
      }
      request.specifier.bssid = *mac;
    }
  }

  if (intent.password) {
    if (intent.password->empty()) {
      ESP_LOGW(TAG, "Empty password, requesting '%s' without a credential",
               intent.ssid.c_str());
    } else if (intent.password->size() > kMaxPasswordLen) {
      ESP_LOGE(TAG, "Password too long (%zu)", intent.password->size());
      return core::Err(ESP_ERR_INVALID_ARG);
    } else {
      request.specifier.passphrase = *intent.password;
    }
  }

  request.specifier.security = intent.security;
  if (intent.security == SecurityMode::Unspecified) {
    ESP_LOGW(TAG, "Unknown security mode, using %s",
             security_mode_to_string(SecurityMode::Psk).data());
    request.specifier.security = SecurityMode::Psk;
  }

  return request;
}

IAssociationBackend *
AssociationController::select_backend(bool force_compat) const {
  if (force_compat) {
    return backends_.compat.get();
  }
  if (backends_.request) {
    return backends_.request.get();
  }
  return backends_.compat.get();
}

core::Status AssociationController::connect(const ConnectionIntent &intent,
                                            Completion on_done) {
  PendingReply reply(std::move(on_done));

  auto request = build_request(intent);
  if (!request) {
    if (auto done = reply.take()) {
      done(false);
    }
    return core::Err(request.error());
  }

  IAssociationBackend *backend = select_backend(intent.force_compat);
  if (backend == nullptr) {
    ESP_LOGE(TAG, "No association backend for this platform%s",
             intent.force_compat ? " (compat forced)" : "");
    if (auto done = reply.take()) {
      done(false);
    }
    return core::Err(ESP_ERR_NOT_SUPPORTED);
  }

  auto timeout =
      intent.timeout.count() > 0 ? intent.timeout : config_.default_timeout;
  if (!backend->supports_timeout()) {
    ESP_LOGD(TAG, "Timeout not supported by %s backend",
             to_string(backend->kind()));
  }

  // Held until the registration is recorded so that requests reach the
  // platform in the same order as their sessions
  core::LockGuard issue(issue_mutex_);

  Token token = 0;
  Deferred deferred;
  {
    core::LockGuard lock(mutex_);
    teardown_locked(deferred);

    token = next_token_++;
    if (next_token_ == 0) {
      next_token_ = 1;
    }
    session_.token = token;
    session_.backend = backend;
    session_.registration = kNoRegistration;
    session_.network = {};
    session_.reply = std::move(reply);
    session_.ssid = intent.ssid;
    set_state_locked(AssociationState::Requesting, deferred);
  }
  run(deferred);

  ESP_LOGI(TAG, "Requesting '%s' via %s backend (internet %s)",
           intent.ssid.c_str(), to_string(backend->kind()),
           intent.requires_internet ? "required" : "not required");

  // The backend may deliver events before request() returns, so the
  // session lock must not be held here.
  auto registration = backend->request(
      *request,
      [this, token](const PlatformEvent &event) { handle_event(token, event); },
      timeout);

  {
    core::LockGuard lock(mutex_);
    const bool current = session_.token == token;
    if (!registration) {
      ESP_LOGE(TAG, "Request for '%s' failed: %s", intent.ssid.c_str(),
               esp_err_to_name(registration.error()));
      if (current && session_.state == AssociationState::Requesting) {
        set_state_locked(AssociationState::Failed, deferred);
        resolve_locked(false, deferred);
      }
    } else if (current && (session_.state == AssociationState::Requesting ||
                           session_.state == AssociationState::Bound)) {
      session_.registration = *registration;
    } else {
      // Superseded or already terminal while the request was being issued
      release_locked(backend, *registration);
    }
  }
  run(deferred);

  if (!registration) {
    return core::Err(registration.error());
  }
  return core::Ok();
}

void AssociationController::handle_event(Token token,
                                         const PlatformEvent &event) {
  Deferred deferred;
  {
    core::LockGuard lock(mutex_);
    if (token == 0 || token != session_.token) {
      ESP_LOGD(TAG, "Ignoring stale %s event", to_string(event.type));
      return;
    }

    switch (event.type) {
    case PlatformEventType::Available: {
      if (session_.state != AssociationState::Requesting) {
        ESP_LOGD(TAG, "Available in state %s ignored",
                 to_string(session_.state));
        break;
      }
      if (session_.backend != nullptr && session_.backend->binds_process()) {
        auto err = platform_.bind_process_to_network(event.network);
        if (!err) {
          ESP_LOGE(TAG, "Failed to bind network %" PRIu32 ": %s",
                   event.network.id, esp_err_to_name(err.error()));
          release_session_locked();
          set_state_locked(AssociationState::Failed, deferred);
          resolve_locked(false, deferred);
          break;
        }
        bound_ = event.network;
      }
      session_.network = event.network;
      ESP_LOGI(TAG, "'%s' available (network %" PRIu32 ")",
               session_.ssid.c_str(), event.network.id);
      set_state_locked(AssociationState::Bound, deferred);
      resolve_locked(true, deferred);
      break;
    }

    case PlatformEventType::Losing:
      ESP_LOGW(TAG, "'%s' losing, %lld ms to live", session_.ssid.c_str(),
               static_cast<long long>(event.max_time_to_live.count()));
      break;

    case PlatformEventType::Lost:
      if (session_.state != AssociationState::Bound ||
          event.network != session_.network) {
        ESP_LOGD(TAG, "Lost for network %" PRIu32 " ignored",
                 event.network.id);
        break;
      }
      ESP_LOGW(TAG, "'%s' lost", session_.ssid.c_str());
      clear_binding_locked();
      release_session_locked();
      set_state_locked(AssociationState::Idle, deferred);
      break;

    case PlatformEventType::Unavailable:
      if (session_.state != AssociationState::Requesting &&
          session_.state != AssociationState::Bound) {
        break;
      }
      ESP_LOGW(TAG, "'%s' unavailable", session_.ssid.c_str());
      clear_binding_locked();
      release_session_locked();
      set_state_locked(AssociationState::Failed, deferred);
      resolve_locked(false, deferred);
      break;
    }
  }
  run(deferred);
}

bool AssociationController::disconnect() {
  core::LockGuard issue(issue_mutex_);
  Deferred deferred;
  bool active = false;
  {
    core::LockGuard lock(mutex_);
    active = session_.state == AssociationState::Requesting ||
             session_.state == AssociationState::Bound;
    teardown_locked(deferred);
  }
  run(deferred);

  if (active) {
    ESP_LOGI(TAG, "Disconnected");
  }
  return active;
}

void AssociationController::reset() { (void)disconnect(); }

core::Status AssociationController::bind_process_traffic(
    std::optional<NetworkHandle> network) {
  core::LockGuard lock(mutex_);
  if (bound_ == network) {
    return core::Ok();
  }
  if (auto err = platform_.bind_process_to_network(network); !err) {
    return err;
  }
  bound_ = network;
  return core::Ok();
}

AssociationState AssociationController::state() const {
  core::LockGuard lock(mutex_);
  return session_.state;
}

std::optional<NetworkHandle> AssociationController::bound_network() const {
  core::LockGuard lock(mutex_);
  return bound_;
}

bool AssociationController::has_backend(BackendKind kind) const {
  return kind == BackendKind::NetworkRequest ? backends_.request != nullptr
                                             : backends_.compat != nullptr;
}

void AssociationController::on_state_change(StateCallback callback) {
  core::LockGuard lock(mutex_);
  state_callback_ = std::move(callback);
}

void AssociationController::set_state_locked(AssociationState next,
                                             Deferred &deferred) {
  AssociationState prev = session_.state;
  if (prev == next) {
    return;
  }
  session_.state = next;
  ESP_LOGD(TAG, "State: %s -> %s", to_string(prev), to_string(next));
  if (state_callback_) {
    deferred.on_state = state_callback_;
    deferred.transitions.emplace_back(prev, next);
  }
}

void AssociationController::resolve_locked(bool result, Deferred &deferred) {
  if (auto done = session_.reply.take()) {
    deferred.completions.emplace_back(std::move(done), result);
  }
}

void AssociationController::release_locked(IAssociationBackend *backend,
                                           RegistrationId id) {
  if (backend == nullptr || id == kNoRegistration) {
    return;
  }
  auto err = backend->release(id);
  if (!err) {
    if (err.error() == ESP_ERR_NOT_FOUND) {
      ESP_LOGD(TAG, "Registration %" PRIu32 " already released", id);
    } else {
      ESP_LOGW(TAG, "Failed to release registration %" PRIu32 ": %s", id,
               esp_err_to_name(err.error()));
    }
  }
}

void AssociationController::release_session_locked() {
  release_locked(session_.backend, session_.registration);
  session_.registration = kNoRegistration;
}

void AssociationController::clear_binding_locked() {
  if (!bound_) {
    return;
  }
  if (auto err = platform_.bind_process_to_network(std::nullopt); !err) {
    ESP_LOGW(TAG, "Failed to clear binding: %s", esp_err_to_name(err.error()));
  }
  bound_.reset();
}

void AssociationController::teardown_locked(Deferred &deferred) {
  release_session_locked();
  clear_binding_locked();
  resolve_locked(false, deferred);

  session_.token = 0;
  session_.backend = nullptr;
  session_.network = {};
  session_.ssid.clear();
  set_state_locked(AssociationState::Idle, deferred);
}

void AssociationController::run(Deferred &deferred) {
  for (const auto &[from, to] : deferred.transitions) {
    deferred.on_state(from, to);
  }
  for (auto &[done, result] : deferred.completions) {
    done(result);
  }
  deferred.transitions.clear();
  deferred.completions.clear();
}

} // namespace network
