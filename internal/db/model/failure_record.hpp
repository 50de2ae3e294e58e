#pragma once

#include <cstdint>
#include <string>

#include "internal/model/transfer.hpp"

namespace fieldwake::db::model {

struct FailureRecord {
  std::string                   id;
  std::string                   device_id;
  std::string                   artifact_name;
  std::string                   wake_event_id;
  fieldwake::model::FailureCode code = fieldwake::model::FailureCode::kNone;
  std::string                   message;
  uint64_t                      reported_at_ms = 0;
};

} // namespace fieldwake::db::model
