/**
 * @file wifi_plugin.cpp
 * @brief WifiPlugin implementation
 */

#include "bridge/wifi_plugin.hpp"

#include "bridge/codec.hpp"

#include <network/network_info.hpp>

#include <esp_log.h>

#include <vector>

namespace bridge {

namespace {
constexpr const char *TAG = "plugin";

MethodReply error_reply(uint32_t id, std::string_view code,
                        std::string_view message) {
  return {.id = id,
          .value = ReplyError{.code = std::string(code),
                              .message = std::string(message)}};
}

bool ask_permissions(const MethodCall &call) {
  const auto *args = std::get_if<PermissionArgs>(&call.args);
  return args != nullptr && args->ask_permissions;
}

} // namespace

WifiPlugin::WifiPlugin(network::AssociationController &controller,
                       network::WifiScanner &scanner,
                       network::IConnectivity &platform,
                       const PluginConfig &config)
    : controller_(controller), scanner_(scanner), platform_(platform),
      config_(config) {}

void WifiPlugin::attach(IMessageChannel &channel) { channel_ = &channel; }

void WifiPlugin::handle(const MethodCall &call, ReplySink reply) {
  ESP_LOGD(TAG, "Call %u: %s", static_cast<unsigned>(call.id),
           call.name.c_str());

  switch (call.method) {
  case Method::CanStartScan:
    reply({.id = call.id,
           .value = network::to_code(
               scanner_.can_start_scan(ask_permissions(call)))});
    break;

  case Method::StartScan:
    reply({.id = call.id, .value = scanner_.start_scan()});
    break;

  case Method::CanGetScannedResults:
    reply({.id = call.id,
           .value = network::to_code(
               scanner_.can_get_scanned_results(ask_permissions(call)))});
    break;

  case Method::GetScannedResults:
    reply({.id = call.id, .value = scanner_.scanned_results()});
    break;

  case Method::Connect:
    handle_connect(call, reply);
    break;

  case Method::Disconnect:
    reply({.id = call.id, .value = controller_.disconnect()});
    break;

  case Method::GetCurrentSsid: {
    MethodReply r{.id = call.id};
    if (auto ssid = network::current_ssid(platform_)) {
      r.value = std::move(*ssid);
    }
    reply(r);
    break;
  }

  case Method::GetCurrentIp: {
    MethodReply r{.id = call.id};
    if (auto ip = network::current_ip(platform_)) {
      r.value = std::move(*ip);
    }
    reply(r);
    break;
  }

  case Method::Listen:
    handle_listen(call, reply);
    break;

  case Method::Cancel: {
    core::LockGuard lock(stream_mutex_);
    subscription_.reset();
    reply({.id = call.id});
    break;
  }

  default:
    ESP_LOGW(TAG, "Method '%s' not implemented", call.name.c_str());
    reply({.id = call.id, .value = NotImplemented{}});
    break;
  }
}

void WifiPlugin::handle_connect(const MethodCall &call,
                                const ReplySink &reply) {
  const auto *args = std::get_if<ConnectArgs>(&call.args);
  if (args == nullptr) {
    reply(error_reply(call.id, errors::INVALID_ARGS,
                      "connect requires ConnectArgs"));
    return;
  }

  network::ConnectionIntent intent{
      .ssid = args->ssid,
      .bssid = args->bssid,
      .password = args->password,
      .security = network::parse_security_mode(args->enterprise_certificate),
      .requires_internet = args->with_internet,
      .timeout = args->timeout_in_seconds > 0
                     ? std::chrono::seconds(args->timeout_in_seconds)
                     : config_.default_timeout,
      .force_compat = args->force_compat,
  };

  const uint32_t id = call.id;
  auto status = controller_.connect(intent, [reply, id](bool connected) {
    reply({.id = id, .value = connected});
  });
  if (!status) {
    // The completion has already replied false
    ESP_LOGW(TAG, "connect('%s') rejected: %s", args->ssid.c_str(),
             esp_err_to_name(status.error()));
  }
}

void WifiPlugin::handle_listen(const MethodCall &call,
                               const ReplySink &reply) {
  const auto *args = std::get_if<StreamArgs>(&call.args);
  if (args == nullptr || args->stream != config_.scan_stream) {
    reply(error_reply(call.id, errors::UNKNOWN_STREAM,
                      args != nullptr ? args->stream : "missing stream"));
    return;
  }

  {
    core::LockGuard lock(stream_mutex_);
    if (!subscription_.active()) {
      subscription_ = scanner_.subscribe(*this);
      ESP_LOGI(TAG, "Scan results stream opened");
    }
  }
  reply({.id = call.id});
}

void WifiPlugin::on_call_frame(std::span<const uint8_t> frame) {
  auto call = decode_call(frame);
  if (!call) {
    send_reply(error_reply(0, errors::DECODE_FAILED,
                           esp_err_to_name(call.error())));
    return;
  }
  handle(*call, [this](const MethodReply &reply) { send_reply(reply); });
}

bool WifiPlugin::listening() const {
  core::LockGuard lock(stream_mutex_);
  return subscription_.active();
}

void WifiPlugin::on_results(const std::vector<network::AccessPoint> &results) {
  send_event({.stream = std::string(config_.scan_stream), .payload = results});
}

void WifiPlugin::on_error(esp_err_t error) {
  ESP_LOGW(TAG, "Scan results stream closed by error");
  send_event({.stream = std::string(config_.scan_stream),
              .payload = ReplyError{.code = std::string(errors::SCAN_FAILED),
                                    .message = esp_err_to_name(error)}});
}

void WifiPlugin::send_reply(const MethodReply &reply) {
  if (channel_ == nullptr) {
    ESP_LOGW(TAG, "No channel, reply %u dropped",
             static_cast<unsigned>(reply.id));
    return;
  }
  std::vector<uint8_t> buffer(kMaxReplySize);
  auto size = encode_reply(reply, buffer);
  if (!size) {
    ESP_LOGE(TAG, "Reply %u not encoded: %s", static_cast<unsigned>(reply.id),
             esp_err_to_name(size.error()));
    return;
  }
  if (auto err = channel_->send(FrameKind::Reply, {buffer.data(), *size});
      !err) {
    ESP_LOGW(TAG, "Reply %u not sent", static_cast<unsigned>(reply.id));
  }
}

void WifiPlugin::send_event(const StreamEvent &event) {
  if (channel_ == nullptr) {
    return;
  }
  std::vector<uint8_t> buffer(kMaxEventSize);
  auto size = encode_event(event, buffer);
  if (!size) {
    ESP_LOGE(TAG, "Stream event not encoded: %s",
             esp_err_to_name(size.error()));
    return;
  }
  if (auto err = channel_->send(FrameKind::Event, {buffer.data(), *size});
      !err) {
    ESP_LOGW(TAG, "Stream event not sent");
  }
}

} // namespace bridge
