#include "client/cpp/wake_client.h"

#include <string>
#include <string_view>

namespace fieldwake::client {

using namespace fieldwake::v1;

namespace {

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
    return arrow::Status::KeyError(std::string(action), ": ", status.error_message());
  }
  if (status.error_code() == grpc::StatusCode::INVALID_ARGUMENT) {
    return arrow::Status::Invalid(std::string(action), ": ", status.error_message());
  }
  return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
}

} // namespace

WakeClient::WakeClient(std::shared_ptr<grpc::Channel> channel)
    : ingest_stub_(WakeIngestService::NewStub(channel)), admin_stub_(WakeAdminService::NewStub(std::move(channel))) {
}

arrow::Result<DeliverResponse> WakeClient::Deliver(const std::string& topic, const std::string& payload) const {
  DeliverRequest req;
  req.set_topic(topic);
  req.set_payload(payload);

  DeliverResponse     response;
  grpc::ClientContext ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(ingest_stub_->Deliver(&ctx, req, &response), "Deliver"));
  return response;
}

std::unique_ptr<grpc::ClientReader<DeviceCommand>> WakeClient::StreamCommands(const std::string& bridge_id, grpc::ClientContext* context) const {
  StreamCommandsRequest req;
  req.set_bridge_id(bridge_id);
  return ingest_stub_->StreamCommands(context, req);
}

arrow::Result<StatsResponse> WakeClient::Stats() const {
  StatsResponse       response;
  grpc::ClientContext ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->Stats(&ctx, StatsRequest{}, &response), "Stats"));
  return response;
}

arrow::Result<WakeEvent> WakeClient::GetWakeEvent(const std::string& id) const {
  GetWakeEventRequest req;
  req.set_id(id);

  WakeEvent           response;
  grpc::ClientContext ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->GetWakeEvent(&ctx, req, &response), "GetWakeEvent"));
  return response;
}

arrow::Result<ListWakeEventsResponse> WakeClient::ListWakeEvents(const std::string& device_id, uint32_t limit) const {
  ListWakeEventsRequest req;
  req.set_device_id(device_id);
  req.set_limit(limit);

  ListWakeEventsResponse response;
  grpc::ClientContext    ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->ListWakeEvents(&ctx, req, &response), "ListWakeEvents"));
  return response;
}

arrow::Result<ImageTransfer> WakeClient::GetTransfer(const std::string& device_id, const std::string& artifact_name) const {
  GetTransferRequest req;
  req.set_device_id(device_id);
  req.set_artifact_name(artifact_name);

  ImageTransfer       response;
  grpc::ClientContext ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->GetTransfer(&ctx, req, &response), "GetTransfer"));
  return response;
}

arrow::Result<DeviceState> WakeClient::GetDevice(const std::string& device_id) const {
  GetDeviceRequest req;
  req.set_device_id(device_id);

  DeviceState         response;
  grpc::ClientContext ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->GetDevice(&ctx, req, &response), "GetDevice"));
  return response;
}

arrow::Result<SweepNowResponse> WakeClient::SweepNow() const {
  SweepNowResponse    response;
  grpc::ClientContext ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->SweepNow(&ctx, SweepNowRequest{}, &response), "SweepNow"));
  return response;
}

} // namespace fieldwake::client
