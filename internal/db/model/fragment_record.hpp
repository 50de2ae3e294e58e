#pragma once

#include <cstdint>
#include <string>

namespace fieldwake::db::model {

struct FragmentRecord {
  std::string device_id;
  std::string artifact_name;
  uint32_t    index = 0;
  std::string bytes;

  uint64_t stored_at_ms  = 0;
  uint64_t expires_at_ms = 0;
};

struct FragmentKey {
  std::string device_id;
  std::string artifact_name;

  bool operator==(const FragmentKey&) const = default;
};

} // namespace fieldwake::db::model
