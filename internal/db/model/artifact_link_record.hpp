#pragma once

#include <cstdint>
#include <string>

namespace fieldwake::db::model {

/*
  Completion journal row: where an artifact landed and who owns it.
*/
struct ArtifactLinkRecord {
  std::string device_id;
  std::string artifact_name;
  std::string wake_event_id;
  std::string storage_location;

  std::string site_id;
  std::string program_id;
  std::string company_id;

  uint64_t size_bytes   = 0;
  uint64_t linked_at_ms = 0;
};

} // namespace fieldwake::db::model
