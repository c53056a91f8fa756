/**
 * @file codec.cpp
 * @brief Conversions between bridge types and nanopb structs
 */

#include "bridge/codec.hpp"

#include "bridge.pb.h"

#include <esp_log.h>

#include <pb_decode.h>
#include <pb_encode.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <string_view>
#include <type_traits>

namespace bridge {

const size_t kMaxCallSize = bridge_MethodCall_size;
const size_t kMaxReplySize = bridge_MethodReply_size;
const size_t kMaxEventSize = bridge_StreamEvent_size;
const size_t kMaxAccessPoints =
    sizeof(bridge_AccessPointList::access_points) /
    sizeof(bridge_AccessPointList::access_points[0]);

namespace {
constexpr const char *TAG = "codec";

/// Copy into a fixed nanopb string field (NUL terminated)
template <size_t N>
[[nodiscard]] bool copy_string(char (&dst)[N], std::string_view src) {
  if (src.size() >= N) {
    return false;
  }
  std::memcpy(dst, src.data(), src.size());
  dst[src.size()] = '\0';
  return true;
}

template <size_t N> std::string to_string(const char (&src)[N]) {
  return {src, strnlen(src, N)};
}

[[nodiscard]] bool to_proto(const network::AccessPoint &ap,
                            bridge_AccessPoint &pb) {
  pb = bridge_AccessPoint_init_zero;
  if (!copy_string(pb.ssid, ap.ssid) || !copy_string(pb.bssid, ap.bssid) ||
      !copy_string(pb.capabilities, ap.capabilities)) {
    return false;
  }
  pb.frequency = ap.frequency_mhz;
  pb.level = ap.level_dbm;
  pb.timestamp = ap.timestamp_us;
  pb.standard = static_cast<int32_t>(ap.standard);
  pb.center_frequency0 = ap.center_frequency0_mhz;
  pb.channel_width = static_cast<int32_t>(ap.channel_width);
  return true;
}

network::AccessPoint from_proto(const bridge_AccessPoint &pb) {
  return {
      .ssid = to_string(pb.ssid),
      .bssid = to_string(pb.bssid),
      .capabilities = to_string(pb.capabilities),
      .frequency_mhz = pb.frequency,
      .level_dbm = pb.level,
      .timestamp_us = pb.timestamp,
      .standard = static_cast<network::WifiStandard>(pb.standard),
      .center_frequency0_mhz = pb.center_frequency0,
      .channel_width = static_cast<network::ChannelWidth>(pb.channel_width),
  };
}

[[nodiscard]] bool to_proto(const AccessPoints &list,
                            bridge_AccessPointList &pb) {
  pb = bridge_AccessPointList_init_zero;
  size_t count = list.size();
  if (count > kMaxAccessPoints) {
    ESP_LOGW(TAG, "Truncating %zu access points to %zu", count,
             kMaxAccessPoints);
    count = kMaxAccessPoints;
  }
  for (size_t i = 0; i < count; ++i) {
    if (!to_proto(list[i], pb.access_points[i])) {
      return false;
    }
  }
  pb.access_points_count = static_cast<pb_size_t>(count);
  return true;
}

AccessPoints from_proto(const bridge_AccessPointList &pb) {
  AccessPoints list;
  list.reserve(pb.access_points_count);
  for (pb_size_t i = 0; i < pb.access_points_count; ++i) {
    list.push_back(from_proto(pb.access_points[i]));
  }
  return list;
}

[[nodiscard]] bool to_proto(const ReplyError &error, bridge_Error &pb) {
  pb = bridge_Error_init_zero;
  return copy_string(pb.code, error.code) &&
         copy_string(pb.message, error.message);
}

ReplyError from_proto(const bridge_Error &pb) {
  return {.code = to_string(pb.code), .message = to_string(pb.message)};
}

template <typename T>
core::Result<size_t> encode(const pb_msgdesc_t *fields, const T &pb,
                            std::span<uint8_t> buffer) {
  pb_ostream_t stream = pb_ostream_from_buffer(buffer.data(), buffer.size());
  if (!pb_encode(&stream, fields, &pb)) {
    ESP_LOGE(TAG, "Encode failed: %s", PB_GET_ERROR(&stream));
    return core::Err(ESP_ERR_INVALID_SIZE);
  }
  return stream.bytes_written;
}

template <typename T>
core::Status decode(const pb_msgdesc_t *fields, T &pb,
                    std::span<const uint8_t> buffer) {
  pb_istream_t stream = pb_istream_from_buffer(buffer.data(), buffer.size());
  if (!pb_decode(&stream, fields, &pb)) {
    ESP_LOGW(TAG, "Decode failed: %s", PB_GET_ERROR(&stream));
    return core::Err(ESP_ERR_INVALID_ARG);
  }
  return core::Ok();
}

} // namespace

core::Result<MethodCall> decode_call(std::span<const uint8_t> buffer) {
  auto pb = std::make_unique<bridge_MethodCall>();
  *pb = bridge_MethodCall_init_zero;
  if (auto err = decode(bridge_MethodCall_fields, *pb, buffer); !err) {
    return core::Err(err.error());
  }

  MethodCall call{
      .id = pb->id,
      .name = to_string(pb->method),
  };
  call.method = parse_method(call.name);

  switch (pb->which_args) {
  case bridge_MethodCall_permission_tag:
    call.args = PermissionArgs{
        .ask_permissions = pb->args.permission.ask_permissions,
    };
    break;
  case bridge_MethodCall_connect_tag: {
    const auto &c = pb->args.connect;
    ConnectArgs args{
        .ssid = to_string(c.ssid),
        .enterprise_certificate = to_string(c.enterprise_certificate),
        .with_internet = c.with_internet,
        .timeout_in_seconds = c.timeout_in_seconds,
        .force_compat = c.force_compat,
    };
    if (c.has_password) {
      args.password = to_string(c.password);
    }
    if (c.has_bssid) {
      args.bssid = to_string(c.bssid);
    }
    call.args = std::move(args);
    break;
  }
  case bridge_MethodCall_stream_tag:
    call.args = StreamArgs{.stream = to_string(pb->args.stream.stream)};
    break;
  default:
    break;
  }

  return call;
}

core::Result<size_t> encode_call(const MethodCall &call,
                                 std::span<uint8_t> buffer) {
  auto pb = std::make_unique<bridge_MethodCall>();
  *pb = bridge_MethodCall_init_zero;
  pb->id = call.id;

  std::string_view name =
      call.method == Method::Unknown ? call.name : method_name(call.method);
  if (!copy_string(pb->method, name)) {
    return core::Err(ESP_ERR_INVALID_SIZE);
  }

  bool ok = true;
  std::visit(
      [&](auto &&args) {
        using T = std::decay_t<decltype(args)>;
        if constexpr (std::is_same_v<T, PermissionArgs>) {
          pb->which_args = bridge_MethodCall_permission_tag;
          pb->args.permission.ask_permissions = args.ask_permissions;
        } else if constexpr (std::is_same_v<T, ConnectArgs>) {
          pb->which_args = bridge_MethodCall_connect_tag;
          auto &c = pb->args.connect;
          c = bridge_ConnectArgs_init_zero;
          ok = copy_string(c.ssid, args.ssid) &&
               copy_string(c.enterprise_certificate,
                           args.enterprise_certificate);
          if (args.password) {
            c.has_password = true;
            ok = ok && copy_string(c.password, *args.password);
          }
          if (args.bssid) {
            c.has_bssid = true;
            ok = ok && copy_string(c.bssid, *args.bssid);
          }
          c.with_internet = args.with_internet;
          c.timeout_in_seconds = args.timeout_in_seconds;
          c.force_compat = args.force_compat;
        } else if constexpr (std::is_same_v<T, StreamArgs>) {
          pb->which_args = bridge_MethodCall_stream_tag;
          ok = copy_string(pb->args.stream.stream, args.stream);
        }
      },
      call.args);

  if (!ok) {
    return core::Err(ESP_ERR_INVALID_SIZE);
  }
  return encode(bridge_MethodCall_fields, *pb, buffer);
}

core::Result<size_t> encode_reply(const MethodReply &reply,
                                  std::span<uint8_t> buffer) {
  auto pb = std::make_unique<bridge_MethodReply>();
  *pb = bridge_MethodReply_init_zero;
  pb->id = reply.id;

  bool ok = true;
  std::visit(
      [&](auto &&value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          pb->which_result = bridge_MethodReply_null_value_tag;
        } else if constexpr (std::is_same_v<T, bool>) {
          pb->which_result = bridge_MethodReply_bool_value_tag;
          pb->result.bool_value = value;
        } else if constexpr (std::is_same_v<T, int32_t>) {
          pb->which_result = bridge_MethodReply_int_value_tag;
          pb->result.int_value = value;
        } else if constexpr (std::is_same_v<T, std::string>) {
          pb->which_result = bridge_MethodReply_string_value_tag;
          ok = copy_string(pb->result.string_value, value);
        } else if constexpr (std::is_same_v<T, AccessPoints>) {
          pb->which_result = bridge_MethodReply_access_points_tag;
          ok = to_proto(value, pb->result.access_points);
        } else if constexpr (std::is_same_v<T, ReplyError>) {
          pb->which_result = bridge_MethodReply_error_tag;
          ok = to_proto(value, pb->result.error);
        } else if constexpr (std::is_same_v<T, NotImplemented>) {
          pb->which_result = bridge_MethodReply_not_implemented_tag;
        }
      },
      reply.value);

  if (!ok) {
    return core::Err(ESP_ERR_INVALID_SIZE);
  }
  return encode(bridge_MethodReply_fields, *pb, buffer);
}

core::Result<MethodReply> decode_reply(std::span<const uint8_t> buffer) {
  auto pb = std::make_unique<bridge_MethodReply>();
  *pb = bridge_MethodReply_init_zero;
  if (auto err = decode(bridge_MethodReply_fields, *pb, buffer); !err) {
    return core::Err(err.error());
  }

  MethodReply reply{.id = pb->id};
  switch (pb->which_result) {
  case bridge_MethodReply_bool_value_tag:
    reply.value = pb->result.bool_value;
    break;
  case bridge_MethodReply_int_value_tag:
    reply.value = pb->result.int_value;
    break;
  case bridge_MethodReply_string_value_tag:
    reply.value = to_string(pb->result.string_value);
    break;
  case bridge_MethodReply_access_points_tag:
    reply.value = from_proto(pb->result.access_points);
    break;
  case bridge_MethodReply_error_tag:
    reply.value = from_proto(pb->result.error);
    break;
  case bridge_MethodReply_not_implemented_tag:
    reply.value = NotImplemented{};
    break;
  default:
    break;
  }
  return reply;
}

core::Result<size_t> encode_event(const StreamEvent &event,
                                  std::span<uint8_t> buffer) {
  auto pb = std::make_unique<bridge_StreamEvent>();
  *pb = bridge_StreamEvent_init_zero;
  if (!copy_string(pb->stream, event.stream)) {
    return core::Err(ESP_ERR_INVALID_SIZE);
  }

  bool ok = true;
  if (const auto *list = std::get_if<AccessPoints>(&event.payload)) {
    pb->which_payload = bridge_StreamEvent_access_points_tag;
    ok = to_proto(*list, pb->payload.access_points);
  } else {
    pb->which_payload = bridge_StreamEvent_error_tag;
    ok = to_proto(std::get<ReplyError>(event.payload), pb->payload.error);
  }

  if (!ok) {
    return core::Err(ESP_ERR_INVALID_SIZE);
  }
  return encode(bridge_StreamEvent_fields, *pb, buffer);
}

core::Result<StreamEvent> decode_event(std::span<const uint8_t> buffer) {
  auto pb = std::make_unique<bridge_StreamEvent>();
  *pb = bridge_StreamEvent_init_zero;
  if (auto err = decode(bridge_StreamEvent_fields, *pb, buffer); !err) {
    return core::Err(err.error());
  }

  StreamEvent event{.stream = to_string(pb->stream)};
  switch (pb->which_payload) {
  case bridge_StreamEvent_access_points_tag:
    event.payload = from_proto(pb->payload.access_points);
    break;
  case bridge_StreamEvent_error_tag:
    event.payload = from_proto(pb->payload.error);
    break;
  default:
    ESP_LOGW(TAG, "Stream event without payload");
    return core::Err(ESP_ERR_INVALID_ARG);
  }
  return event;
}

} // namespace bridge
