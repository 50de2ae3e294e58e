#include "internal/core/wake_router.hpp"

#include <mutex>
#include <type_traits>
#include <variant>
#include <vector>

#include "internal/chunks/chunk_store.hpp"
#include "internal/command/command_publisher.hpp"
#include "internal/core/device_locks.hpp"
#include "internal/core/fragment_recovery.hpp"
#include "internal/core/wake_planning.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/lineage/lineage_resolver.hpp"
#include "internal/model/protocol_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/protocol/message_codec.hpp"
#include "internal/util/uuid.hpp"

namespace fieldwake::core {

using db::model::DeviceRecord;
using db::model::ImageTransferRecord;
using db::model::WakeEventRecord;
using model::ProtocolState;
using model::TransferStatus;

namespace {

constexpr const char* kPendingMapping  = "pending_mapping";
constexpr const char* kPendingApproval = "pending_approval";
constexpr const char* kActive          = "active";

void ApplyEnvironment(DeviceRecord& device, const protocol::EnvironmentReading& env) {
  if (env.temperature) device.temperature = env.temperature;
  if (env.humidity) device.humidity = env.humidity;
  if (env.pressure) device.pressure = env.pressure;
  if (env.gas_resistance) device.gas_resistance = env.gas_resistance;
}

void ApplyPower(DeviceRecord& device, const std::optional<int32_t>& rssi, const std::optional<double>& voltage) {
  if (rssi) device.wifi_rssi = rssi;
  if (voltage) {
    device.battery_voltage        = voltage;
    device.battery_health_percent = protocol::BatteryHealthPercent(*voltage);
  }
}

// Unknown devices are recorded on first contact, waiting for a site.
DeviceRecord LoadOrProvision(db::Repository& repo, db::Transaction& tx, const std::string& device_id, uint64_t now_ms) {
  auto existing = repo.GetDevice(tx, device_id);
  if (existing) {
    existing->last_seen_at_ms = now_ms;
    return *existing;
  }

  FIELDWAKE_LOG_INFO("auto-provisioned device", {observability::StringField("device_id", device_id)});
  DeviceRecord device;
  device.device_id           = device_id;
  device.provisioning_status = kPendingMapping;
  device.first_seen_at_ms    = now_ms;
  device.last_seen_at_ms     = now_ms;
  return device;
}

std::string ProvisioningStatus(const std::optional<lineage::DeviceLineage>& lineage) {
  if (!lineage || !lineage->mapped) return kPendingMapping;
  if (!lineage->approved) return kPendingApproval;
  return kActive;
}

std::optional<WakeEventRecord> InFlightWake(db::Repository& repo, db::Transaction& tx, const std::string& device_id) {
  auto latest = repo.LatestWakeEvent(tx, device_id);
  if (latest && !model::IsTerminal(latest->state)) return latest;
  return std::nullopt;
}

void Transition(WakeEventRecord& wake, ProtocolState to) {
  model::RequireTransition(wake.state, to);
  wake.state = to;
}

} // namespace

std::string_view ToString(Disposition disposition) {
  switch (disposition) {
    case Disposition::kAccepted:
      return "accepted";
    case Disposition::kDuplicate:
      return "duplicate";
  }
  return "unknown";
}

WakeRouter::WakeRouter(EngineContext context) : ctx_(std::move(context)), finalizer_(ctx_) {
}

RouteResult WakeRouter::Route(const protocol::InboundMessage& message) {
  const auto& device_id = protocol::DeviceIdOf(message);

  auto                        device_mutex = ctx_.locks->For(device_id);
  std::lock_guard<std::mutex> lock(*device_mutex);

  return std::visit(
      [this](const auto& msg) -> RouteResult {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, protocol::AliveMessage>) {
          return HandleAlive(msg);
        } else if constexpr (std::is_same_v<T, protocol::MetadataMessage>) {
          return HandleMetadata(msg);
        } else if constexpr (std::is_same_v<T, protocol::FragmentMessage>) {
          return HandleFragment(msg);
        } else {
          return HandleTelemetry(msg);
        }
      },
      message);
}

RouteResult WakeRouter::HandleAlive(const protocol::AliveMessage& message) {
  auto&      repo    = *ctx_.repository;
  const auto now     = ctx_.now();
  const auto now_ms  = util::ToUnixMillis(now);
  const auto lineage = ctx_.lineage->Resolve(message.device_id);
  const bool admit   = lineage && lineage->mapped && lineage->approved;

  WakeEventRecord wake;
  wake.id            = util::NewUUIDString();
  wake.device_id     = message.device_id;
  wake.state         = ProtocolState::kHelloReceived;
  wake.hello_at_ms   = now_ms;
  wake.pending_count = message.pending_count;

  {
    auto tx = repo.Begin();

    auto device                = LoadOrProvision(repo, *tx, message.device_id, now_ms);
    device.provisioning_status = ProvisioningStatus(lineage);
    device.pending_count       = message.pending_count;
    if (!message.firmware_version.empty()) device.firmware_version = message.firmware_version;
    if (!message.hardware_version.empty()) device.hardware_version = message.hardware_version;
    ApplyPower(device, message.wifi_rssi, message.battery_voltage);
    ApplyEnvironment(device, message.environment);
    db::ThrowIfError(repo.UpsertDevice(*tx, device), "upsert device");

    if (auto previous = InFlightWake(repo, *tx, message.device_id)) {
      Transition(*previous, ProtocolState::kFailed);
      previous->failure_reason = "superseded_by_new_wake";
      db::ThrowIfError(repo.UpdateWakeEvent(*tx, *previous), "supersede wake event");
      FIELDWAKE_LOG_WARN("superseded in-flight wake",
                         {observability::StringField("device_id", message.device_id), observability::StringField("wake_event_id", previous->id)});
    }

    if (!admit) {
      const auto plan = PlanNextWake(SchedulingLineage(lineage, message.device_id, device.wake_schedule), now, ctx_.settings);
      Transition(wake, ProtocolState::kSleepOnly);
      wake.next_wake_at_ms   = util::ToUnixMillis(absl::ToChronoTime(plan.instant));
      wake.next_wake_display = plan.display;
      wake.sleep_sent_at_ms  = now_ms;
    } else {
      Transition(wake, ProtocolState::kAckSent);
      wake.ack_at_ms     = now_ms;
      wake.artifact_name = message.device_id + "_" + std::to_string(now_ms) + ".jpg";
      Transition(wake, ProtocolState::kSnapSent);
      wake.capture_requested_at_ms = now_ms;
      wake.images_requested += 1;
    }

    db::ThrowIfError(repo.InsertWakeEvent(*tx, wake), "insert wake event");
    tx->Commit();
  }

  if (!admit) {
    FIELDWAKE_LOG_INFO("device not mapped or approved; sleep only",
                       {observability::StringField("device_id", message.device_id), observability::BoolField("known", lineage.has_value()),
                        observability::StringField("next_wake", wake.next_wake_display)});
    ctx_.commands->PublishSleep(message.device_id, wake.next_wake_display);
    return {Disposition::kAccepted, "sleep_only"};
  }

  FIELDWAKE_LOG_INFO("wake accepted; capture requested",
                     {observability::StringField("device_id", message.device_id), observability::StringField("wake_event_id", wake.id),
                      observability::StringField("artifact", wake.artifact_name), observability::IntField("pending", message.pending_count)});
  ctx_.commands->PublishCapture(message.device_id, wake.artifact_name);
  return {Disposition::kAccepted, "capture_requested"};
}

RouteResult WakeRouter::HandleMetadata(const protocol::MetadataMessage& message) {
  auto&      repo   = *ctx_.repository;
  const auto now_ms = util::ToUnixMillis(ctx_.now());

  if (message.device_error != 0) {
    FIELDWAKE_LOG_WARN("device reported capture error",
                       {observability::StringField("device_id", message.device_id), observability::StringField("artifact", message.artifact_name),
                        observability::IntField("error", message.device_error)});
  }

  uint32_t total = message.total_fragments;
  bool     resent = false;
  {
    auto tx       = repo.Begin();
    auto existing = repo.GetTransfer(*tx, message.device_id, message.artifact_name);

    if (existing && existing->status == TransferStatus::kComplete) {
      tx->Rollback();
      FIELDWAKE_LOG_INFO("metadata for completed artifact ignored",
                         {observability::StringField("device_id", message.device_id), observability::StringField("artifact", message.artifact_name)});
      return {Disposition::kDuplicate, "artifact already complete"};
    }

    // metadata repeated for a transfer still receiving: the device finished a pass
    resent = existing && existing->status == TransferStatus::kReceiving;

    ImageTransferRecord transfer;
    if (!existing) {
      transfer.device_id     = message.device_id;
      transfer.artifact_name = message.artifact_name;
      transfer.created_at_ms = now_ms;
    } else {
      transfer = *existing;
      if (transfer.status == TransferStatus::kFailed) {
        FIELDWAKE_LOG_INFO("reopening failed transfer",
                           {observability::StringField("device_id", message.device_id), observability::StringField("artifact", message.artifact_name),
                            observability::StringField("previous_failure", model::ToString(transfer.failure_code)),
                            observability::IntField("retry", transfer.retry_count + 1)});
        transfer.retry_count += 1;
        transfer.missing_requests  = 0;
        transfer.recovery_boundary = 0;
        transfer.failure_code      = model::FailureCode::kNone;
      }
    }

    transfer.status          = TransferStatus::kReceiving;
    transfer.total_fragments = message.total_fragments;
    if (message.image_size != 0) transfer.image_size = message.image_size;
    if (message.max_chunk_size != 0) transfer.max_chunk_size = message.max_chunk_size;
    if (!message.capture_timestamp.empty()) transfer.capture_timestamp = message.capture_timestamp;
    transfer.updated_at_ms = now_ms;

    // fragments may have arrived before their metadata
    uint32_t stored = 0;
    for (auto index : repo.ListFragmentIndices(*tx, message.device_id, message.artifact_name)) {
      if (index < total) ++stored;
    }
    transfer.received_fragments = stored;

    // link to the wake that asked for it; resumed older artifacts are linked the same way
    std::optional<WakeEventRecord> wake;
    if (!transfer.wake_event_id.empty()) {
      wake = repo.GetWakeEvent(*tx, transfer.wake_event_id);
      if (wake && model::IsTerminal(wake->state)) wake.reset();
    }
    if (!wake) wake = InFlightWake(repo, *tx, message.device_id);

    if (wake) {
      transfer.wake_event_id = wake->id;
      wake->metadata_at_ms   = now_ms;
      db::ThrowIfError(repo.UpdateWakeEvent(*tx, *wake), "record metadata arrival");
    }

    db::ThrowIfError(repo.UpsertTransfer(*tx, transfer), "upsert transfer");
    tx->Commit();

    FIELDWAKE_LOG_INFO("transfer metadata",
                       {observability::StringField("device_id", message.device_id), observability::StringField("artifact", message.artifact_name),
                        observability::IntField("total", total), observability::IntField("already_stored", stored),
                        observability::StringField("wake_event_id", transfer.wake_event_id)});
  }

  if (ctx_.chunks->IsComplete(message.device_id, message.artifact_name, total)) {
    auto outcome = finalizer_.Finalize(message.device_id, message.artifact_name);
    return {Disposition::kAccepted, std::string(ToString(outcome))};
  }
  if (resent && RequestMissingFragments(ctx_, message.device_id, message.artifact_name)) {
    return {Disposition::kAccepted, "missing_requested"};
  }
  return {Disposition::kAccepted, "receiving"};
}

RouteResult WakeRouter::HandleFragment(const protocol::FragmentMessage& message) {
  auto& repo = *ctx_.repository;

  const bool newly = ctx_.chunks->StoreFragment(message.device_id, message.artifact_name, message.index, message.bytes);
  observability::Metrics::Instance().RecordFragment(newly);
  if (!newly) {
    FIELDWAKE_LOG_DEBUG("duplicate fragment absorbed",
                        {observability::StringField("device_id", message.device_id), observability::StringField("artifact", message.artifact_name),
                         observability::IntField("index", message.index)});
    return {Disposition::kDuplicate, "fragment already stored"};
  }

  ImageTransferRecord transfer;
  {
    auto tx       = repo.Begin();
    auto existing = repo.GetTransfer(*tx, message.device_id, message.artifact_name);
    if (!existing) {
      tx->Commit();
      return {Disposition::kAccepted, "stored before metadata"};
    }
    transfer = *existing;

    if (transfer.status == TransferStatus::kComplete) {
      tx->Commit();
    } else if (transfer.status == TransferStatus::kFailed) {
      tx->Commit();
      return {Disposition::kAccepted, "stored for failed transfer"};
    } else {
      transfer.received_fragments += 1;
      transfer.last_fragment_at_ms = util::ToUnixMillis(ctx_.now());
      transfer.updated_at_ms       = transfer.last_fragment_at_ms;
      db::ThrowIfError(repo.UpsertTransfer(*tx, transfer), "count fragment");
      tx->Commit();
    }
  }

  // redelivery after completion: the finalize already cleared this key
  if (transfer.status == TransferStatus::kComplete) {
    ctx_.chunks->Clear(message.device_id, message.artifact_name);
    return {Disposition::kDuplicate, "artifact already complete"};
  }

  const auto total = transfer.total_fragments;
  if (ctx_.chunks->IsComplete(message.device_id, message.artifact_name, total)) {
    auto outcome = finalizer_.Finalize(message.device_id, message.artifact_name);
    return {Disposition::kAccepted, std::string(ToString(outcome))};
  }

  // the device has finished a pass: last index, or past the last gap we asked for
  const bool pass_done = message.index + 1 >= total || (transfer.missing_requests > 0 && message.index >= transfer.recovery_boundary);
  if (pass_done) {
    RequestMissingFragments(ctx_, message.device_id, message.artifact_name);
  }
  return {Disposition::kAccepted, "receiving"};
}

RouteResult WakeRouter::HandleTelemetry(const protocol::TelemetryMessage& message) {
  auto&      repo   = *ctx_.repository;
  const auto now_ms = util::ToUnixMillis(ctx_.now());

  auto tx     = repo.Begin();
  auto device = LoadOrProvision(repo, *tx, message.device_id, now_ms);
  ApplyPower(device, message.wifi_rssi, message.battery_voltage);
  ApplyEnvironment(device, message.environment);
  db::ThrowIfError(repo.UpsertDevice(*tx, device), "record telemetry");
  tx->Commit();

  return {Disposition::kAccepted, "telemetry"};
}

} // namespace fieldwake::core
