#include "ingest_service.hpp"

#include <string>

#include "internal/command/command_queue.hpp"
#include "internal/core/wake_router.hpp"
#include "internal/observability/logging.hpp"
#include "internal/protocol/message_codec.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace fieldwake::service {

using namespace fieldwake::v1;

IngestService::IngestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

DeliverResponse IngestService::Deliver(const DeliverRequest& req) {
  protocol::InboundMessage message;
  try {
    message = protocol::DecodeInbound(req.topic(), req.payload());
  } catch (const util::MalformedMessage& e) {
    FIELDWAKE_LOG_WARN("discarded malformed message", {observability::StringField("topic", req.topic()), observability::StringField("reason", e.what()),
                                                       observability::IntField("bytes", static_cast<int64_t>(req.payload().size()))});
    observability::Metrics::Instance().RecordRequest("IngestService.Deliver.discarded", true);

    DeliverResponse resp;
    resp.set_disposition(DELIVERY_DISPOSITION_DISCARDED);
    resp.set_detail(e.what());
    return resp;
  }

  const auto& device_id = protocol::DeviceIdOf(message);
  return ObserveRpc("IngestService.Deliver", device_id, [&] {
    FIELDWAKE_LOG_DEBUG("device message", {observability::StringField("device_id", device_id),
                                           observability::StringField("kind", protocol::MessageKind(message))});

    const auto result = ctx_.router->Route(message);

    DeliverResponse resp;
    resp.set_disposition(result.disposition == core::Disposition::kDuplicate ? DELIVERY_DISPOSITION_DUPLICATE : DELIVERY_DISPOSITION_ACCEPTED);
    resp.set_detail(result.detail);
    return resp;
  });
}

std::optional<DeviceCommand> IngestService::NextCommand(std::chrono::milliseconds timeout) {
  return ctx_.commands->Pop(timeout);
}

bool IngestService::CommandsClosed() const {
  return ctx_.commands->IsShutdown();
}

} // namespace fieldwake::service
