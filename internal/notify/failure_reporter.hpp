#pragma once

#include <string>

#include "internal/model/transfer.hpp"
#include "internal/util/time.hpp"

namespace fieldwake::notify {

struct FailureReport {
  std::string        device_id;
  std::string        artifact_name;
  std::string        wake_event_id;
  model::FailureCode code = model::FailureCode::kNone;
  std::string        message;
  util::TimePoint    reported_at;
};

// Called once per failed transfer attempt; there is no internal retry.
class FailureReporter {
 public:
  virtual ~FailureReporter() = default;

  virtual void Report(const FailureReport& report) = 0;
};

} // namespace fieldwake::notify
