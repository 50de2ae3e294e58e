#include "internal/protocol/message_codec.hpp"

#include <absl/strings/escaping.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <variant>

#include "fieldwake/device/v1/directives.pb.h"
#include "internal/protocol/topics.hpp"
#include "internal/util/errors.hpp"

namespace fieldwake::protocol {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

const Value* Find(const Struct& body, std::initializer_list<const char*> names) {
  for (const char* name : names) {
    const auto it = body.fields().find(name);
    if (it != body.fields().end() && it->second.kind_case() != Value::kNullValue) return &it->second;
  }
  return nullptr;
}

std::optional<double> Number(const Struct& body, std::initializer_list<const char*> names) {
  const auto* value = Find(body, names);
  if (!value) return std::nullopt;
  if (value->kind_case() != Value::kNumberValue) {
    throw util::MalformedMessage(std::string("field ") + *names.begin() + " is not a number");
  }
  return value->number_value();
}

// Largest integer a JSON number carries without rounding.
constexpr double kMaxExactInteger = 9007199254740992.0;

std::optional<uint64_t> Count(const Struct& body, std::initializer_list<const char*> names, double max = UINT32_MAX) {
  const auto number = Number(body, names);
  if (!number) return std::nullopt;
  if (!std::isfinite(*number) || *number < 0 || std::floor(*number) != *number) {
    throw util::MalformedMessage(std::string("field ") + *names.begin() + " must be a non-negative integer");
  }
  if (*number > max) {
    throw util::MalformedMessage(std::string("field ") + *names.begin() + " is out of range");
  }
  return static_cast<uint64_t>(*number);
}

std::optional<int32_t> SignedInt(const Struct& body, std::initializer_list<const char*> names) {
  const auto number = Number(body, names);
  if (!number) return std::nullopt;
  if (!std::isfinite(*number) || *number < INT32_MIN || *number > INT32_MAX) {
    throw util::MalformedMessage(std::string("field ") + *names.begin() + " is out of range");
  }
  return static_cast<int32_t>(std::lround(*number));
}

std::string Text(const Struct& body, std::initializer_list<const char*> names) {
  const auto* value = Find(body, names);
  if (!value) return {};
  if (value->kind_case() == Value::kStringValue) return value->string_value();
  if (value->kind_case() == Value::kNumberValue) {
    const double n = value->number_value();
    if (std::floor(n) == n && std::fabs(n) <= kMaxExactInteger) return std::to_string(static_cast<int64_t>(n));
    return std::to_string(n);
  }
  throw util::MalformedMessage(std::string("field ") + *names.begin() + " is not a string");
}

EnvironmentReading ReadEnvironment(const Struct& body) {
  // nested sensor_data wins over flat fields
  const Struct* source = &body;
  if (const auto* nested = Find(body, {"sensor_data"}); nested && nested->kind_case() == Value::kStructValue) {
    source = &nested->struct_value();
  }

  EnvironmentReading env;
  env.temperature    = Number(*source, {"temperature"});
  env.humidity       = Number(*source, {"humidity"});
  env.pressure       = Number(*source, {"pressure"});
  env.gas_resistance = Number(*source, {"gas_resistance"});

  if (source != &body) {
    if (!env.temperature) env.temperature = Number(body, {"temperature"});
    if (!env.humidity) env.humidity = Number(body, {"humidity"});
    if (!env.pressure) env.pressure = Number(body, {"pressure"});
    if (!env.gas_resistance) env.gas_resistance = Number(body, {"gas_resistance"});
  }
  return env;
}

std::optional<int32_t> Rssi(const Struct& body) {
  return SignedInt(body, {"wifi_rssi"});
}

std::string DecodePayload(const Value& payload) {
  std::string bytes;
  if (payload.kind_case() == Value::kStringValue) {
    if (!absl::Base64Unescape(payload.string_value(), &bytes)) {
      throw util::MalformedMessage("fragment payload is not valid base64");
    }
  } else if (payload.kind_case() == Value::kListValue) {
    bytes.reserve(static_cast<std::size_t>(payload.list_value().values_size()));
    for (const auto& item : payload.list_value().values()) {
      const double b = item.kind_case() == Value::kNumberValue ? item.number_value() : -1;
      if (b < 0 || b > 255 || std::floor(b) != b) {
        throw util::MalformedMessage("fragment payload array must hold byte values");
      }
      bytes.push_back(static_cast<char>(static_cast<unsigned char>(b)));
    }
  } else {
    throw util::MalformedMessage("fragment payload must be a base64 string or a byte array");
  }

  if (bytes.empty()) throw util::MalformedMessage("fragment payload is empty");
  return bytes;
}

std::string ResolveDeviceId(const Struct& body, const Topic& topic) {
  auto device_id = NormalizeDeviceId(Text(body, {"device_id", "device_mac"}));
  if (device_id.empty()) device_id = NormalizeDeviceId(topic.device_segment);
  if (device_id.empty()) throw util::MalformedMessage("message carries no device id");
  return device_id;
}

AliveMessage DecodeAlive(const Struct& body, std::string device_id) {
  const auto status = Text(body, {"status"});
  if (!status.empty() && status != "alive") {
    throw util::MalformedMessage("unsupported status '" + status + "'");
  }

  AliveMessage msg;
  msg.device_id        = std::move(device_id);
  msg.pending_count    = static_cast<uint32_t>(Count(body, {"pending_count", "pendingImg"}).value_or(0));
  msg.firmware_version = Text(body, {"firmware_version"});
  msg.hardware_version = Text(body, {"hardware_version"});
  msg.wifi_rssi        = Rssi(body);
  msg.battery_voltage  = Number(body, {"battery_voltage"});
  msg.environment      = ReadEnvironment(body);
  return msg;
}

FragmentMessage DecodeFragment(const Struct& body, std::string device_id) {
  FragmentMessage msg;
  msg.device_id     = std::move(device_id);
  msg.artifact_name = Text(body, {"image_name"});
  if (msg.artifact_name.empty()) throw util::MalformedMessage("fragment without image_name");

  const auto index = Count(body, {"chunk_id"});
  if (!index || *index > UINT32_MAX) throw util::MalformedMessage("fragment with invalid chunk_id");
  msg.index = static_cast<uint32_t>(*index);

  const auto* payload = Find(body, {"payload"});
  if (!payload) throw util::MalformedMessage("fragment without payload");
  msg.bytes = DecodePayload(*payload);
  return msg;
}

MetadataMessage DecodeMetadata(const Struct& body, std::string device_id) {
  MetadataMessage msg;
  msg.device_id     = std::move(device_id);
  msg.artifact_name = Text(body, {"image_name"});

  const auto total = Count(body, {"total_chunks_count", "total_chunk_count"});
  if (!total || *total == 0 || *total > UINT32_MAX) {
    throw util::MalformedMessage("metadata for " + msg.artifact_name + " without a positive chunk count");
  }
  msg.total_fragments   = static_cast<uint32_t>(*total);
  msg.image_size        = Count(body, {"image_size"}, kMaxExactInteger).value_or(0);
  msg.max_chunk_size    = static_cast<uint32_t>(Count(body, {"max_chunk_size", "max_chunks_size"}).value_or(0));
  msg.capture_timestamp = Text(body, {"capture_timestamp", "timestamp", "capture_timeStamp"});
  msg.location          = Text(body, {"location"});
  msg.device_error      = SignedInt(body, {"error"}).value_or(0);
  msg.environment       = ReadEnvironment(body);
  return msg;
}

} // namespace

InboundMessage DecodeInbound(std::string_view topic_name, std::string_view payload) {
  const auto topic = ParseTopic(topic_name);
  if (!topic) throw util::MalformedMessage("unrecognised topic '" + std::string(topic_name) + "'");
  if (topic->kind == TopicKind::kCommand) throw util::MalformedMessage("command topic is outbound only");

  Struct     body;
  const auto status = google::protobuf::util::JsonStringToMessage(std::string(payload), &body);
  if (!status.ok()) throw util::MalformedMessage("payload is not a JSON object: " + status.ToString());

  auto device_id = ResolveDeviceId(body, *topic);

  if (topic->kind == TopicKind::kStatus) return DecodeAlive(body, std::move(device_id));

  const bool has_name = !Text(body, {"image_name"}).empty();
  if (Find(body, {"chunk_id"})) return DecodeFragment(body, std::move(device_id));
  if (has_name) return DecodeMetadata(body, std::move(device_id));

  TelemetryMessage telemetry;
  telemetry.environment = ReadEnvironment(body);
  if (!telemetry.environment.Any()) throw util::MalformedMessage("data message is neither metadata, fragment nor telemetry");
  telemetry.device_id       = std::move(device_id);
  telemetry.captured_at     = Text(body, {"captured_at"});
  telemetry.wifi_rssi       = Rssi(body);
  telemetry.battery_voltage = Number(body, {"battery_voltage"});
  return telemetry;
}

std::string_view MessageKind(const InboundMessage& message) {
  struct Visitor {
    std::string_view operator()(const AliveMessage&) const { return "alive"; }
    std::string_view operator()(const MetadataMessage&) const { return "metadata"; }
    std::string_view operator()(const FragmentMessage&) const { return "fragment"; }
    std::string_view operator()(const TelemetryMessage&) const { return "telemetry"; }
  };
  return std::visit(Visitor{}, message);
}

const std::string& DeviceIdOf(const InboundMessage& message) {
  return std::visit([](const auto& m) -> const std::string& { return m.device_id; }, message);
}

namespace {

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string out;
  const auto  status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) throw std::runtime_error("render directive: " + status.ToString());
  return out;
}

} // namespace

std::string RenderCaptureDirective(const std::string& device_id, const std::string& artifact_name) {
  device::v1::CaptureDirective directive;
  directive.set_device_id(device_id);
  directive.set_capture_image(true);
  directive.set_image_name(artifact_name);
  return ToJson(directive);
}

std::string RenderMissingDirective(const std::string& device_id, const std::string& artifact_name, const std::vector<uint32_t>& missing) {
  device::v1::MissingChunksDirective directive;
  directive.set_device_id(device_id);
  directive.set_image_name(artifact_name);
  for (const auto index : missing) directive.add_missing_chunks(index);
  return ToJson(directive);
}

std::string RenderSleepDirective(const std::string& device_id, const std::string& next_wake_display) {
  device::v1::SleepDirective directive;
  directive.set_device_id(device_id);
  directive.set_next_wake(next_wake_display);
  return ToJson(directive);
}

double BatteryHealthPercent(double voltage) {
  return std::clamp((voltage - 3.0) / 1.2 * 100.0, 0.0, 100.0);
}

} // namespace fieldwake::protocol
