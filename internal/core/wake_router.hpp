#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/core/engine_context.hpp"
#include "internal/core/finalizer.hpp"
#include "internal/protocol/inbound_message.hpp"

namespace fieldwake::core {

enum class Disposition {
  kAccepted,
  kDuplicate,
};

std::string_view ToString(Disposition disposition);

struct RouteResult {
  Disposition disposition = Disposition::kAccepted;
  std::string detail;
};

/*
  WakeRouter

  Drives the wake protocol for every decoded device message:

    alive      -> device upsert, new wake, capture request or sleep_only
    metadata   -> create / reuse / reopen the transfer, finalize if ready;
                  a repeat for an unfinished transfer requests the gaps
    fragment   -> idempotent store, finalize or targeted missing request
    telemetry  -> device readings only

  Messages for one device are serialised on that device's lock; the
  finalizer runs under the same lock.
*/
class WakeRouter {
 public:
  explicit WakeRouter(EngineContext context);

  RouteResult Route(const protocol::InboundMessage& message);

 private:
  RouteResult HandleAlive(const protocol::AliveMessage& message);
  RouteResult HandleMetadata(const protocol::MetadataMessage& message);
  RouteResult HandleFragment(const protocol::FragmentMessage& message);
  RouteResult HandleTelemetry(const protocol::TelemetryMessage& message);

  EngineContext ctx_;
  Finalizer     finalizer_;
};

} // namespace fieldwake::core
