#pragma once

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>

#include "fieldwake/services/v1/wake_ingest_service.grpc.pb.h"
#include "internal/service/ingest_service.hpp"

namespace fieldwake::grpc {

class IngestServer final : public fieldwake::services::v1::WakeIngestService::Service {
 public:
  explicit IngestServer(std::shared_ptr<fieldwake::service::IngestService> svc,
                        std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500));

  ::grpc::Status Deliver(::grpc::ServerContext*, const fieldwake::v1::DeliverRequest*, fieldwake::v1::DeliverResponse*) override;

  // Streams directives until the bridge disconnects or the server shuts down.
  ::grpc::Status StreamCommands(::grpc::ServerContext*, const fieldwake::v1::StreamCommandsRequest*,
                                ::grpc::ServerWriter<fieldwake::core::v1::DeviceCommand>*) override;

 private:
  std::shared_ptr<fieldwake::service::IngestService> service_;
  std::chrono::milliseconds                          poll_interval_;
};

} // namespace fieldwake::grpc
