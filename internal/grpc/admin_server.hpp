#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "fieldwake/services/v1/wake_admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace fieldwake::grpc {

class AdminServer final : public fieldwake::services::v1::WakeAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<fieldwake::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*, const fieldwake::v1::StatsRequest*, fieldwake::v1::StatsResponse*) override;

  ::grpc::Status GetWakeEvent(::grpc::ServerContext*, const fieldwake::v1::GetWakeEventRequest*, fieldwake::v1::WakeEvent*) override;

  ::grpc::Status ListWakeEvents(::grpc::ServerContext*, const fieldwake::v1::ListWakeEventsRequest*, fieldwake::v1::ListWakeEventsResponse*) override;

  ::grpc::Status GetTransfer(::grpc::ServerContext*, const fieldwake::v1::GetTransferRequest*, fieldwake::v1::ImageTransfer*) override;

  ::grpc::Status GetDevice(::grpc::ServerContext*, const fieldwake::v1::GetDeviceRequest*, fieldwake::v1::DeviceState*) override;

  ::grpc::Status SweepNow(::grpc::ServerContext*, const fieldwake::v1::SweepNowRequest*, fieldwake::v1::SweepNowResponse*) override;

 private:
  std::shared_ptr<fieldwake::service::AdminService> service_;
};

} // namespace fieldwake::grpc
