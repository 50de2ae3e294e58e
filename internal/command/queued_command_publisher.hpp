#pragma once

#include <memory>

#include "internal/command/command_publisher.hpp"
#include "internal/command/command_queue.hpp"
#include "internal/util/time.hpp"

namespace fieldwake::command {

/*
  Renders directives as DeviceCommand envelopes (cmd topic + firmware JSON)
  and hands them to the queue drained by WakeIngestService.StreamCommands.
*/
class QueuedCommandPublisher final : public CommandPublisher {
 public:
  explicit QueuedCommandPublisher(std::shared_ptr<CommandQueue> queue, util::NowFn now = util::Now);

  void PublishCapture(const std::string& device_id, const std::string& artifact_name) override;
  void PublishMissingFragments(const std::string& device_id, const std::string& artifact_name,
                               const std::vector<uint32_t>& missing) override;
  void PublishSleep(const std::string& device_id, const std::string& next_wake_display) override;

 private:
  void Enqueue(const std::string& device_id, fieldwake::v1::CommandKind kind, std::string payload_json);

  std::shared_ptr<CommandQueue> queue_;
  util::NowFn                   now_;
};

} // namespace fieldwake::command
