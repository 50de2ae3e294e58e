#pragma once

#include <cstdint>
#include <string>

#include "internal/model/transfer.hpp"

namespace fieldwake::db::model {

/*
  Reassembly bookkeeping for one (device, artifact) pair.
*/
struct ImageTransferRecord {
  std::string device_id;
  std::string artifact_name;
  std::string wake_event_id;

  uint32_t total_fragments    = 0;
  uint32_t received_fragments = 0;

  fieldwake::model::TransferStatus status       = fieldwake::model::TransferStatus::kReceiving;
  fieldwake::model::FailureCode    failure_code = fieldwake::model::FailureCode::kNone;
  std::string                      storage_location;

  uint32_t retry_count       = 0;
  uint32_t missing_requests  = 0;
  uint32_t recovery_boundary = 0;

  std::string capture_timestamp;
  uint64_t    image_size     = 0;
  uint32_t    max_chunk_size = 0;

  uint64_t created_at_ms       = 0;
  uint64_t updated_at_ms       = 0;
  uint64_t last_fragment_at_ms = 0;
};

} // namespace fieldwake::db::model
