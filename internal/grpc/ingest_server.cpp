#include "ingest_server.hpp"

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace fieldwake::grpc {

using namespace fieldwake::v1;

IngestServer::IngestServer(std::shared_ptr<fieldwake::service::IngestService> svc, std::chrono::milliseconds poll_interval)
    : service_(std::move(svc)), poll_interval_(poll_interval) {
}

::grpc::Status IngestServer::Deliver(::grpc::ServerContext*, const DeliverRequest* req, DeliverResponse* resp) {
  try {
    *resp = service_->Deliver(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::StreamCommands(::grpc::ServerContext* context, const StreamCommandsRequest* req,
                                            ::grpc::ServerWriter<DeviceCommand>* writer) {
  FIELDWAKE_LOG_INFO("command stream opened", {observability::StringField("bridge_id", req->bridge_id())});
  try {
    while (!context->IsCancelled()) {
      auto command = service_->NextCommand(poll_interval_);
      if (!command) {
        if (service_->CommandsClosed()) break;
        continue;
      }
      if (!writer->Write(*command)) {
        // Only this stream saw it; the device re-wakes on its own timer.
        FIELDWAKE_LOG_WARN("command stream write failed; directive lost",
                           {observability::StringField("bridge_id", req->bridge_id()), observability::StringField("device_id", command->device_id()),
                            observability::StringField("topic", command->topic())});
        break;
      }
    }
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
  FIELDWAKE_LOG_INFO("command stream closed", {observability::StringField("bridge_id", req->bridge_id())});
  return ::grpc::Status::OK;
}

} // namespace fieldwake::grpc
