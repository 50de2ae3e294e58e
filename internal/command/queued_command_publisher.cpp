#include "internal/command/queued_command_publisher.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/protocol/message_codec.hpp"
#include "internal/protocol/topics.hpp"

namespace fieldwake::command {

QueuedCommandPublisher::QueuedCommandPublisher(std::shared_ptr<CommandQueue> queue, util::NowFn now)
    : queue_(std::move(queue)), now_(std::move(now)) {
}

void QueuedCommandPublisher::PublishCapture(const std::string& device_id, const std::string& artifact_name) {
  Enqueue(device_id, fieldwake::v1::COMMAND_KIND_CAPTURE, protocol::RenderCaptureDirective(device_id, artifact_name));
}

void QueuedCommandPublisher::PublishMissingFragments(const std::string& device_id, const std::string& artifact_name,
                                                     const std::vector<uint32_t>& missing) {
  Enqueue(device_id, fieldwake::v1::COMMAND_KIND_MISSING_FRAGMENTS, protocol::RenderMissingDirective(device_id, artifact_name, missing));
}

void QueuedCommandPublisher::PublishSleep(const std::string& device_id, const std::string& next_wake_display) {
  Enqueue(device_id, fieldwake::v1::COMMAND_KIND_SLEEP, protocol::RenderSleepDirective(device_id, next_wake_display));
}

void QueuedCommandPublisher::Enqueue(const std::string& device_id, fieldwake::v1::CommandKind kind, std::string payload_json) {
  fieldwake::v1::DeviceCommand command;
  command.set_device_id(device_id);
  command.set_topic(protocol::CommandTopic(device_id));
  command.set_kind(kind);
  command.set_payload_json(std::move(payload_json));
  *command.mutable_issued_at() = util::ToProto(now_());

  const auto kind_name = fieldwake::v1::CommandKind_Name(kind);
  FIELDWAKE_LOG_DEBUG("publishing device command",
                      {observability::StringField("device_id", device_id), observability::StringField("kind", kind_name)});
  observability::Metrics::Instance().RecordCommand(kind_name);

  queue_->Push(std::move(command));
}

} // namespace fieldwake::command
