#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fieldwake::command {

/*
  Outbound directives to a device. Implementations must not block on the
  transport; the router calls these while holding the device's lock.
*/
class CommandPublisher {
 public:
  virtual ~CommandPublisher() = default;

  virtual void PublishCapture(const std::string& device_id, const std::string& artifact_name) = 0;

  virtual void PublishMissingFragments(const std::string& device_id, const std::string& artifact_name,
                                       const std::vector<uint32_t>& missing) = 0;

  // `next_wake_display` is the device-local "5:30PM" form.
  virtual void PublishSleep(const std::string& device_id, const std::string& next_wake_display) = 0;
};

} // namespace fieldwake::command
