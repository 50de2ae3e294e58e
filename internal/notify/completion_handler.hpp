#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace fieldwake::notify {

struct CompletedArtifact {
  std::string device_id;
  std::string artifact_name;
  std::string wake_event_id;
  std::string storage_location;

  std::string site_id;
  std::string program_id;
  std::string company_id;

  uint64_t        size_bytes = 0;
  util::TimePoint completed_at;
};

/*
  Downstream hand-off once an artifact is durably stored. Throwing marks
  the transfer completion_failed.
*/
class CompletionHandler {
 public:
  virtual ~CompletionHandler() = default;

  virtual void OnArtifactStored(const CompletedArtifact& artifact) = 0;
};

} // namespace fieldwake::notify
