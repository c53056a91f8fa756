/**
 * @file association_backend.hpp
 * @brief Uniform association interface over the platform's mechanisms
 *
 * The platform either supports capability-based network requests or only
 * stored network configurations (or both). detect_backends() inspects the
 * platform once and builds the backends it supports, so the controller never
 * branches on platform version.
 */

#pragma once

#include "connectivity.hpp"

#include <core/result.hpp>

#include <chrono>
#include <memory>

namespace network {

enum class BackendKind : uint8_t {
  NetworkRequest,
  ConfiguredNetwork,
};

[[nodiscard]] constexpr const char *to_string(BackendKind kind) {
  return kind == BackendKind::NetworkRequest ? "network-request"
                                             : "configured-network";
}

class IAssociationBackend {
public:
  virtual ~IAssociationBackend() = default;

  [[nodiscard]] virtual BackendKind kind() const = 0;

  /// Whether request() honours its timeout argument
  [[nodiscard]] virtual bool supports_timeout() const = 0;

  /// Whether an Available network should be bound for process traffic
  [[nodiscard]] virtual bool binds_process() const = 0;

  /// Start associating. Events may be delivered before this returns.
  [[nodiscard]] virtual core::Result<RegistrationId>
  request(const NetworkRequest &request, EventHandler handler,
          std::chrono::milliseconds timeout) = 0;

  /// Cancel a registration
  /// @return ESP_ERR_NOT_FOUND if it was already released
  [[nodiscard]] virtual core::Status release(RegistrationId id) = 0;
};

/// Capability-based network request
class NetworkRequestBackend final : public IAssociationBackend {
public:
  explicit NetworkRequestBackend(IConnectivity &platform)
      : platform_(platform), timeout_(platform.capabilities().request_timeout) {}

  [[nodiscard]] BackendKind kind() const override {
    return BackendKind::NetworkRequest;
  }
  [[nodiscard]] bool supports_timeout() const override { return timeout_; }
  [[nodiscard]] bool binds_process() const override { return true; }

  [[nodiscard]] core::Result<RegistrationId>
  request(const NetworkRequest &request, EventHandler handler,
          std::chrono::milliseconds timeout) override;

  [[nodiscard]] core::Status release(RegistrationId id) override;

private:
  IConnectivity &platform_;
  bool timeout_;
};

/// Stored-configuration path: resolves as soon as the platform accepts and
/// enables the configuration, without waiting for the association itself.
class ConfiguredNetworkBackend final : public IAssociationBackend {
public:
  explicit ConfiguredNetworkBackend(IConnectivity &platform)
      : platform_(platform) {}

  [[nodiscard]] BackendKind kind() const override {
    return BackendKind::ConfiguredNetwork;
  }
  [[nodiscard]] bool supports_timeout() const override { return false; }
  [[nodiscard]] bool binds_process() const override { return false; }

  [[nodiscard]] core::Result<RegistrationId>
  request(const NetworkRequest &request, EventHandler handler,
          std::chrono::milliseconds timeout) override;

  [[nodiscard]] core::Status release(RegistrationId id) override;

private:
  IConnectivity &platform_;
};

/// Backends available on a platform (either may be null)
struct AssociationBackends {
  std::unique_ptr<IAssociationBackend> request;
  std::unique_ptr<IAssociationBackend> compat;
};

/// Build the backends the platform supports
[[nodiscard]] AssociationBackends detect_backends(IConnectivity &platform);

} // namespace network
