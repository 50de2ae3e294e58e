#pragma once

#include "fieldwake/v1.hpp"
#include "service_context.hpp"

namespace fieldwake::service {

/*
  Read-only operator surface plus an on-demand sweep.
  Missing records throw util::NotFound.
*/
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  fieldwake::v1::StatsResponse Stats(const fieldwake::v1::StatsRequest& req);

  fieldwake::v1::WakeEvent GetWakeEvent(const fieldwake::v1::GetWakeEventRequest& req);

  fieldwake::v1::ListWakeEventsResponse ListWakeEvents(const fieldwake::v1::ListWakeEventsRequest& req);

  fieldwake::v1::ImageTransfer GetTransfer(const fieldwake::v1::GetTransferRequest& req);

  fieldwake::v1::DeviceState GetDevice(const fieldwake::v1::GetDeviceRequest& req);

  fieldwake::v1::SweepNowResponse SweepNow(const fieldwake::v1::SweepNowRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace fieldwake::service
