#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>
#include <grpcpp/support/sync_stream.h>

#include <cstdint>
#include <memory>
#include <string>

#include "fieldwake/v1.hpp"

namespace fieldwake::client {

/*
  Thin client over WakeIngestService and WakeAdminService.

  Used by fieldwakectl, by transport bridges (Deliver + StreamCommands)
  and by the simulated-device example.
*/
class WakeClient {
 public:
  explicit WakeClient(std::shared_ptr<grpc::Channel> channel);

  arrow::Result<fieldwake::v1::DeliverResponse> Deliver(const std::string& topic, const std::string& payload) const;

  // Caller owns the context; cancel it to end the stream.
  std::unique_ptr<grpc::ClientReader<fieldwake::v1::DeviceCommand>> StreamCommands(const std::string& bridge_id,
                                                                                   grpc::ClientContext* context) const;

  arrow::Result<fieldwake::v1::StatsResponse> Stats() const;

  arrow::Result<fieldwake::v1::WakeEvent> GetWakeEvent(const std::string& id) const;

  arrow::Result<fieldwake::v1::ListWakeEventsResponse> ListWakeEvents(const std::string& device_id, uint32_t limit) const;

  arrow::Result<fieldwake::v1::ImageTransfer> GetTransfer(const std::string& device_id, const std::string& artifact_name) const;

  arrow::Result<fieldwake::v1::DeviceState> GetDevice(const std::string& device_id) const;

  arrow::Result<fieldwake::v1::SweepNowResponse> SweepNow() const;

 private:
  std::unique_ptr<fieldwake::v1::WakeIngestService::Stub> ingest_stub_;
  std::unique_ptr<fieldwake::v1::WakeAdminService::Stub>  admin_stub_;
};

} // namespace fieldwake::client
