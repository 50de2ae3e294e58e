#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace fieldwake::db::model {

struct DeviceRecord {
  std::string device_id;
  std::string provisioning_status;

  std::string firmware_version;
  std::string hardware_version;

  std::optional<int32_t> wifi_rssi;
  std::optional<double>  battery_voltage;
  std::optional<double>  battery_health_percent;
  std::optional<double>  temperature;
  std::optional<double>  humidity;
  std::optional<double>  pressure;
  std::optional<double>  gas_resistance;

  uint32_t pending_count = 0;

  uint64_t first_seen_at_ms = 0;
  uint64_t last_seen_at_ms  = 0;
  uint64_t last_wake_at_ms  = 0;
  uint64_t next_wake_at_ms  = 0;

  std::string wake_schedule;
};

} // namespace fieldwake::db::model
