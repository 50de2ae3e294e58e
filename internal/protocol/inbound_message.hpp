#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace fieldwake::protocol {

struct EnvironmentReading {
  std::optional<double> temperature;
  std::optional<double> humidity;
  std::optional<double> pressure;
  std::optional<double> gas_resistance;

  bool Any() const {
    return temperature || humidity || pressure || gas_resistance;
  }
};

// ESP32CAM/<mac>/status, status == "alive"
struct AliveMessage {
  std::string device_id;
  uint32_t    pending_count = 0;

  std::string            firmware_version;
  std::string            hardware_version;
  std::optional<int32_t> wifi_rssi;
  std::optional<double>  battery_voltage;

  EnvironmentReading environment;
};

struct MetadataMessage {
  std::string device_id;
  std::string artifact_name;
  uint32_t    total_fragments = 0;
  uint64_t    image_size      = 0;
  uint32_t    max_chunk_size  = 0;

  std::string capture_timestamp;
  std::string location;
  int32_t     device_error = 0;

  EnvironmentReading environment;
};

struct FragmentMessage {
  std::string device_id;
  std::string artifact_name;
  uint32_t    index = 0;
  std::string bytes;
};

// Sensor readings outside of an image transfer.
struct TelemetryMessage {
  std::string            device_id;
  std::string            captured_at;
  std::optional<int32_t> wifi_rssi;
  std::optional<double>  battery_voltage;

  EnvironmentReading environment;
};

using InboundMessage = std::variant<AliveMessage, MetadataMessage, FragmentMessage, TelemetryMessage>;

} // namespace fieldwake::protocol
