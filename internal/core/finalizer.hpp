#pragma once

#include <string>
#include <string_view>

#include "internal/core/engine_context.hpp"
#include "internal/db/model/image_transfer_record.hpp"
#include "internal/model/transfer.hpp"

namespace fieldwake::core {

enum class FinalizeOutcome {
  kFinalized,
  kAlreadyFinalized,
  kIncomplete,
  kFailed,
};

std::string_view ToString(FinalizeOutcome outcome);

/*
  Finalizer

  Turns a fully received transfer into a stored artifact and puts the
  device back to sleep:

    assemble -> upload -> completion hand-off -> mark complete
             -> schedule next wake -> sleep directive -> clear fragments

  A failure in the first three steps marks the transfer failed, reports
  it once and leaves the fragments for the TTL sweep. The wake event is
  not touched on failure.

  The caller holds the device lock. Must not be called inside an open
  repository transaction.
*/
class Finalizer {
 public:
  explicit Finalizer(EngineContext context);

  FinalizeOutcome Finalize(const std::string& device_id, const std::string& artifact_name);

 private:
  FinalizeOutcome Fail(const db::model::ImageTransferRecord& transfer, model::FailureCode code, const std::string& message);

  EngineContext ctx_;
};

} // namespace fieldwake::core
