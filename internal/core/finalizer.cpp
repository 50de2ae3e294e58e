#include "internal/core/finalizer.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>

#include "internal/chunks/chunk_store.hpp"
#include "internal/command/command_publisher.hpp"
#include "internal/core/wake_planning.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/lineage/lineage_resolver.hpp"
#include "internal/model/protocol_state.hpp"
#include "internal/notify/completion_handler.hpp"
#include "internal/notify/failure_reporter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/deadline.hpp"

namespace fieldwake::core {

using db::model::ImageTransferRecord;
using db::model::WakeEventRecord;
using model::ProtocolState;

namespace {

// Walks the main lifecycle edge by edge so every hop is checked.
void AdvanceWake(WakeEventRecord& wake, ProtocolState target) {
  while (wake.state != target) {
    auto next = static_cast<ProtocolState>(static_cast<int>(wake.state) + 1);
    if (model::IsTerminal(wake.state) || static_cast<int>(wake.state) > static_cast<int>(target)) {
      model::RequireTransition(wake.state, target);
    }
    model::RequireTransition(wake.state, next);
    wake.state = next;
  }
}

// The wake the device is currently in: the one the transfer is linked to,
// or the device's latest in-flight wake when that one is already closed.
std::optional<WakeEventRecord> ActiveWake(db::Repository& repo, db::Transaction& tx, const ImageTransferRecord& transfer) {
  if (!transfer.wake_event_id.empty()) {
    auto linked = repo.GetWakeEvent(tx, transfer.wake_event_id);
    if (linked && !model::IsTerminal(linked->state)) return linked;
  }
  auto latest = repo.LatestWakeEvent(tx, transfer.device_id);
  if (latest && !model::IsTerminal(latest->state)) return latest;
  return std::nullopt;
}

} // namespace

std::string_view ToString(FinalizeOutcome outcome) {
  switch (outcome) {
    case FinalizeOutcome::kFinalized:
      return "finalized";
    case FinalizeOutcome::kAlreadyFinalized:
      return "already_finalized";
    case FinalizeOutcome::kIncomplete:
      return "incomplete";
    case FinalizeOutcome::kFailed:
      return "failed";
  }
  return "unknown";
}

Finalizer::Finalizer(EngineContext context) : ctx_(std::move(context)) {
}

FinalizeOutcome Finalizer::Finalize(const std::string& device_id, const std::string& artifact_name) {
  observability::SpanScope span("Finalizer.Finalize");
  span.SetAttribute("device.id", device_id);
  span.SetAttribute("artifact.name", artifact_name);

  auto& repo = *ctx_.repository;

  ImageTransferRecord transfer;
  {
    auto tx       = repo.Begin();
    auto existing = repo.GetTransfer(*tx, device_id, artifact_name);
    tx->Commit();
    if (!existing || existing->status != model::TransferStatus::kReceiving) {
      observability::Metrics::Instance().RecordFinalize(ToString(FinalizeOutcome::kAlreadyFinalized));
      return FinalizeOutcome::kAlreadyFinalized;
    }
    transfer = *existing;
  }

  if (!ctx_.chunks->HasFragments(device_id, artifact_name)) {
    observability::Metrics::Instance().RecordFinalize(ToString(FinalizeOutcome::kAlreadyFinalized));
    return FinalizeOutcome::kAlreadyFinalized;
  }
  if (!ctx_.chunks->IsComplete(device_id, artifact_name, transfer.total_fragments)) {
    observability::Metrics::Instance().RecordFinalize(ToString(FinalizeOutcome::kIncomplete));
    return FinalizeOutcome::kIncomplete;
  }

  std::string bytes;
  try {
    bytes = ctx_.chunks->Assemble(device_id, artifact_name, transfer.total_fragments);
  } catch (const chunks::AssemblyError& e) {
    span.RecordException(e.what());
    return Fail(transfer, model::FailureCode::kAssemblyFailed, e.what());
  }

  const auto lineage = ctx_.lineage->Resolve(device_id);
  const auto key     = storage::common::ArtifactKey(lineage ? lineage->company_id : "", lineage ? lineage->site_id : "", device_id, artifact_name);

  std::string location;
  try {
    auto       store   = ctx_.artifacts;
    const auto started = std::chrono::steady_clock::now();
    location = util::CallWithTimeout("artifact upload", ctx_.settings.external_call_timeout, [store, key, bytes] { return store->Put(key, bytes); });
    observability::Metrics::Instance().ObserveUploadDurationMs(
        store->Kind(), std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count());
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    return Fail(transfer, model::FailureCode::kUploadFailed, e.what());
  }
  span.AddEvent("artifact.uploaded");

  notify::CompletedArtifact completed;
  completed.device_id        = device_id;
  completed.artifact_name    = artifact_name;
  completed.wake_event_id    = transfer.wake_event_id;
  completed.storage_location = location;
  completed.size_bytes       = bytes.size();
  completed.completed_at     = ctx_.now();
  if (lineage) {
    completed.site_id    = lineage->site_id;
    completed.program_id = lineage->program_id;
    completed.company_id = lineage->company_id;
  }

  try {
    auto handler = ctx_.completion;
    util::CallWithTimeout("completion hand-off", ctx_.settings.external_call_timeout, [handler, completed] { handler->OnArtifactStored(completed); });
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    return Fail(transfer, model::FailureCode::kCompletionFailed, e.what());
  }

  const auto now    = ctx_.now();
  const auto now_ms = util::ToUnixMillis(now);

  std::string                    display;
  std::optional<WakeEventRecord> wake;
  uint64_t                       planned_ms = 0;
  uint64_t                       kept_ms    = 0;
  {
    auto tx      = repo.Begin();
    auto current = repo.GetTransfer(*tx, device_id, artifact_name);
    if (!current) {
      throw util::NotFound("transfer vanished during finalize: " + device_id + "/" + artifact_name);
    }
    current->status           = model::TransferStatus::kComplete;
    current->failure_code     = model::FailureCode::kNone;
    current->storage_location = location;
    current->updated_at_ms    = now_ms;
    db::ThrowIfError(repo.UpsertTransfer(*tx, *current), "complete transfer");

    wake = ActiveWake(repo, *tx, *current);

    auto device          = repo.GetDevice(*tx, device_id);
    auto stored_schedule = device ? device->wake_schedule : std::string{};

    const auto reference = wake ? util::FromUnixMillis(wake->hello_at_ms) : now;
    const auto plan      = PlanNextWake(SchedulingLineage(lineage, device_id, stored_schedule), reference, ctx_.settings);
    const auto next_ms   = util::ToUnixMillis(absl::ToChronoTime(plan.instant));
    display              = plan.display;

    planned_ms = next_ms;
    if (device) {
      device->last_wake_at_ms = std::max(device->last_wake_at_ms, util::ToUnixMillis(reference));
      // the device row never moves backwards; the wake keeps what the directive announced
      if (device->next_wake_at_ms > next_ms) {
        kept_ms = device->next_wake_at_ms;
      } else {
        device->next_wake_at_ms = next_ms;
      }
      db::ThrowIfError(repo.UpsertDevice(*tx, *device), "advance device schedule");
    }

    if (wake) {
      AdvanceWake(*wake, ProtocolState::kMetadataReceived);
      AdvanceWake(*wake, ProtocolState::kComplete);
      wake->is_complete = true;
      wake->images_completed += 1;
      wake->sleep_sent_at_ms  = now_ms;
      wake->next_wake_at_ms   = next_ms;
      wake->next_wake_display = display;
      if (wake->metadata_at_ms == 0) wake->metadata_at_ms = now_ms;
      db::ThrowIfError(repo.UpdateWakeEvent(*tx, *wake), "complete wake event");
    }

    tx->Commit();

    if (kept_ms != 0) {
      span.SetAttribute("schedule.held_back_ms", static_cast<int64_t>(kept_ms - planned_ms));
      FIELDWAKE_LOG_WARN("device next wake held at a later instant than planned",
                         {observability::StringField("device_id", device_id), observability::StringField("artifact", artifact_name),
                          observability::IntField("planned_ms", static_cast<int64_t>(planned_ms)),
                          observability::IntField("kept_ms", static_cast<int64_t>(kept_ms))});
    }

    FIELDWAKE_LOG_INFO("artifact finalized", {observability::StringField("device_id", device_id), observability::StringField("artifact", artifact_name),
                                              observability::StringField("location", location), observability::IntField("bytes", static_cast<int64_t>(bytes.size())),
                                              observability::StringField("next_wake", display), observability::StringField("schedule_source", schedule::ToString(plan.source))});
  }

  if (wake) {
    ctx_.commands->PublishSleep(device_id, display);
  } else {
    FIELDWAKE_LOG_WARN("finalized without an active wake; no sleep directive sent",
                       {observability::StringField("device_id", device_id), observability::StringField("artifact", artifact_name)});
  }

  ctx_.chunks->Clear(device_id, artifact_name);

  observability::Metrics::Instance().RecordFinalize(ToString(FinalizeOutcome::kFinalized));
  return FinalizeOutcome::kFinalized;
}

FinalizeOutcome Finalizer::Fail(const ImageTransferRecord& transfer, model::FailureCode code, const std::string& message) {
  const auto now = ctx_.now();
  {
    auto& repo    = *ctx_.repository;
    auto  tx      = repo.Begin();
    auto  current = repo.GetTransfer(*tx, transfer.device_id, transfer.artifact_name).value_or(transfer);
    current.status        = model::TransferStatus::kFailed;
    current.failure_code  = code;
    current.updated_at_ms = util::ToUnixMillis(now);
    db::ThrowIfError(repo.UpsertTransfer(*tx, current), "mark transfer failed");
    tx->Commit();
  }

  notify::FailureReport report;
  report.device_id     = transfer.device_id;
  report.artifact_name = transfer.artifact_name;
  report.wake_event_id = transfer.wake_event_id;
  report.code          = code;
  report.message       = message;
  report.reported_at   = now;

  try {
    ctx_.failures->Report(report);
  } catch (const std::exception& e) {
    FIELDWAKE_LOG_ERROR("failure report could not be delivered",
                        {observability::StringField("device_id", transfer.device_id), observability::StringField("artifact", transfer.artifact_name),
                         observability::StringField("code", model::ToString(code)), observability::StringField("error", e.what())});
  }

  observability::Metrics::Instance().RecordFinalize(model::ToString(code));
  return FinalizeOutcome::kFailed;
}

} // namespace fieldwake::core
