#pragma once

#include <chrono>
#include <optional>

#include "fieldwake/v1.hpp"
#include "service_context.hpp"

namespace fieldwake::service {

/*
  Transport-facing half of the engine: device messages in, directives out.
*/
class IngestService {
 public:
  explicit IngestService(ServiceContext ctx);

  // Malformed input is answered with DISCARDED, not an error.
  fieldwake::v1::DeliverResponse Deliver(const fieldwake::v1::DeliverRequest& req);

  // Next outbound directive; nullopt on timeout or once the queue is shut down and empty.
  std::optional<fieldwake::v1::DeviceCommand> NextCommand(std::chrono::milliseconds timeout);

  bool CommandsClosed() const;

 private:
  ServiceContext ctx_;
};

} // namespace fieldwake::service
