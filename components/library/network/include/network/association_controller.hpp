/**
 * @file association_controller.hpp
 * @brief Joins a specific WiFi network and routes process traffic over it
 *
 * One association session at a time. A new connect() supersedes the previous
 * session: its registration is released before the new request is issued,
 * so events from an older request can never rebind traffic or resolve the
 * new caller.
 *
 * Thread model: connect()/disconnect() run on the caller's task, platform
 * events arrive on the platform's event task. Session state is guarded by a
 * FreeRTOS mutex; completions and state callbacks run after it is released.
 * connect()/disconnect() are additionally serialized against each other so
 * that teardown, request and registration happen as one step. Event
 * handling never takes that lock.
 */

#pragma once

#include "association_backend.hpp"
#include "connectivity.hpp"
#include "pending_reply.hpp"
#include "wifi_types.hpp"

#include <core/mutex.hpp>
#include <core/result.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace network {

/// Controller configuration
struct AssociationConfig {
  /// Used when a connect intent carries no positive timeout
  std::chrono::milliseconds default_timeout{defaults::REQUEST_TIMEOUT};
};

class AssociationController {
public:
  using Completion = PendingReply::Completion;
  using StateCallback =
      std::function<void(AssociationState from, AssociationState to)>;

  /// Detects the platform's backends once; the platform must outlive this
  explicit AssociationController(IConnectivity &platform,
                                 const AssociationConfig &config = {});

  /// Releases any outstanding registration and binding
  ~AssociationController();

  AssociationController(const AssociationController &) = delete;
  AssociationController &operator=(const AssociationController &) = delete;
  AssociationController(AssociationController &&) = delete;
  AssociationController &operator=(AssociationController &&) = delete;

  /// Request association with the network described by intent.
  ///
  /// on_done is invoked exactly once: true when the network became available
  /// (and traffic was bound to it), false on rejection, unavailability,
  /// supersession by a later connect(), or disconnect() before resolution.
  /// Returns without waiting for the platform.
  ///
  /// @return ESP_ERR_INVALID_ARG for a bad ssid/bssid/password,
  ///         ESP_ERR_NOT_SUPPORTED when the platform has no usable backend,
  ///         or the platform's error if the request could not be issued
  [[nodiscard]] core::Status connect(const ConnectionIntent &intent,
                                     Completion on_done);

  /// Abandon the current session
  /// @return true if a requesting or bound session was torn down
  bool disconnect();

  /// Return to Idle unconditionally
  void reset();

  /// Bind process traffic to network, or clear the binding with nullopt.
  /// Binding the already bound network is a successful no-op.
  [[nodiscard]] core::Status
  bind_process_traffic(std::optional<NetworkHandle> network);

  [[nodiscard]] AssociationState state() const;

  [[nodiscard]] std::optional<NetworkHandle> bound_network() const;

  [[nodiscard]] bool has_backend(BackendKind kind) const;

  /// Observe session state transitions (not called under the lock)
  void on_state_change(StateCallback callback);

private:
  using Token = uint32_t;

  struct Session {
    Token token = 0;
    IAssociationBackend *backend = nullptr;
    RegistrationId registration = kNoRegistration;
    NetworkHandle network{};
    AssociationState state = AssociationState::Idle;
    PendingReply reply;
    std::string ssid;
  };

  /// Work collected under the lock and run after it is released
  struct Deferred {
    StateCallback on_state;
    std::vector<std::pair<AssociationState, AssociationState>> transitions;
    std::vector<std::pair<Completion, bool>> completions;
  };

  [[nodiscard]] static core::Result<NetworkRequest>
  build_request(const ConnectionIntent &intent);

  [[nodiscard]] IAssociationBackend *select_backend(bool force_compat) const;

  void handle_event(Token token, const PlatformEvent &event);

  void set_state_locked(AssociationState next, Deferred &deferred);
  void resolve_locked(bool result, Deferred &deferred);
  void release_locked(IAssociationBackend *backend, RegistrationId id);
  void release_session_locked();
  void clear_binding_locked();
  void teardown_locked(Deferred &deferred);

  static void run(Deferred &deferred);

  IConnectivity &platform_;
  AssociationConfig config_;
  AssociationBackends backends_;

  /// Serializes connect()/disconnect(); recursive so that a completion may
  /// start a new session from the caller's task
  core::RecursiveMutex issue_mutex_;

  mutable core::Mutex mutex_;
  Session session_;
  Token next_token_ = 1;
  std::optional<NetworkHandle> bound_;
  StateCallback state_callback_;
};

} // namespace network
