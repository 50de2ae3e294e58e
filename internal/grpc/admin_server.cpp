#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace fieldwake::grpc {

using namespace fieldwake::v1;

AdminServer::AdminServer(std::shared_ptr<fieldwake::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetWakeEvent(::grpc::ServerContext*, const GetWakeEventRequest* req, WakeEvent* resp) {
  try {
    *resp = service_->GetWakeEvent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListWakeEvents(::grpc::ServerContext*, const ListWakeEventsRequest* req, ListWakeEventsResponse* resp) {
  try {
    *resp = service_->ListWakeEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetTransfer(::grpc::ServerContext*, const GetTransferRequest* req, ImageTransfer* resp) {
  try {
    *resp = service_->GetTransfer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetDevice(::grpc::ServerContext*, const GetDeviceRequest* req, DeviceState* resp) {
  try {
    *resp = service_->GetDevice(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::SweepNow(::grpc::ServerContext*, const SweepNowRequest* req, SweepNowResponse* resp) {
  try {
    *resp = service_->SweepNow(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace fieldwake::grpc
