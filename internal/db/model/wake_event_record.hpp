#pragma once

#include <cstdint>
#include <string>

#include "internal/model/protocol_state.hpp"

namespace fieldwake::db::model {

/*
  One row per device wake attempt. Append-only audit trail: rows are
  updated by the engine but never deleted.
*/
struct WakeEventRecord {
  std::string id;
  std::string device_id;
  std::string artifact_name;

  fieldwake::model::ProtocolState state = fieldwake::model::ProtocolState::kHelloReceived;

  uint64_t hello_at_ms             = 0;
  uint64_t ack_at_ms               = 0;
  uint64_t capture_requested_at_ms = 0;
  uint64_t metadata_at_ms          = 0;
  uint64_t sleep_sent_at_ms        = 0;

  bool     is_complete      = false;
  uint32_t images_requested = 0;
  uint32_t images_completed = 0;
  uint32_t pending_count    = 0;

  uint64_t    next_wake_at_ms = 0;
  std::string next_wake_display;
  std::string failure_reason;
};

} // namespace fieldwake::db::model
