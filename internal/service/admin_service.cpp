#include "admin_service.hpp"

#include <string>

#include "internal/command/command_queue.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/protocol/topics.hpp"
#include "internal/sweep/chunk_sweeper.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace fieldwake::service {

using namespace fieldwake::v1;

namespace {

WakeEvent ToProto(const db::model::WakeEventRecord& record) {
  WakeEvent out;
  out.set_id(record.id);
  out.set_device_id(record.device_id);
  out.set_artifact_name(record.artifact_name);
  out.set_state(static_cast<fieldwake::v1::ProtocolState>(static_cast<int>(record.state) + 1));
  *out.mutable_hello_at()             = util::MillisToProto(record.hello_at_ms);
  *out.mutable_ack_at()               = util::MillisToProto(record.ack_at_ms);
  *out.mutable_capture_requested_at() = util::MillisToProto(record.capture_requested_at_ms);
  *out.mutable_metadata_at()          = util::MillisToProto(record.metadata_at_ms);
  *out.mutable_sleep_sent_at()        = util::MillisToProto(record.sleep_sent_at_ms);
  out.set_is_complete(record.is_complete);
  out.set_images_requested(record.images_requested);
  out.set_images_completed(record.images_completed);
  out.set_pending_count(record.pending_count);
  *out.mutable_next_wake_at() = util::MillisToProto(record.next_wake_at_ms);
  out.set_next_wake_display(record.next_wake_display);
  out.set_failure_reason(record.failure_reason);
  return out;
}

ImageTransfer ToProto(const db::model::ImageTransferRecord& record) {
  ImageTransfer out;
  out.set_device_id(record.device_id);
  out.set_artifact_name(record.artifact_name);
  out.set_wake_event_id(record.wake_event_id);
  out.set_total_fragments(record.total_fragments);
  out.set_received_fragments(record.received_fragments);
  out.set_status(static_cast<fieldwake::v1::TransferStatus>(record.status));
  out.set_storage_location(record.storage_location);
  out.set_failure_code(static_cast<fieldwake::v1::FailureCode>(record.failure_code));
  out.set_retry_count(record.retry_count);
  out.set_missing_requests(record.missing_requests);
  *out.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  *out.mutable_updated_at() = util::MillisToProto(record.updated_at_ms);
  return out;
}

DeviceState ToProto(const db::model::DeviceRecord& record) {
  DeviceState out;
  out.set_device_id(record.device_id);
  out.set_provisioning_status(record.provisioning_status);
  out.set_firmware_version(record.firmware_version);
  out.set_hardware_version(record.hardware_version);
  out.set_wifi_rssi(record.wifi_rssi.value_or(0));
  out.set_battery_voltage(record.battery_voltage.value_or(0.0));
  out.set_battery_health_percent(record.battery_health_percent.value_or(0.0));
  out.set_temperature(record.temperature.value_or(0.0));
  out.set_humidity(record.humidity.value_or(0.0));
  out.set_pressure(record.pressure.value_or(0.0));
  out.set_gas_resistance(record.gas_resistance.value_or(0.0));
  out.set_pending_count(record.pending_count);
  *out.mutable_first_seen_at() = util::MillisToProto(record.first_seen_at_ms);
  *out.mutable_last_seen_at()  = util::MillisToProto(record.last_seen_at_ms);
  *out.mutable_last_wake_at()  = util::MillisToProto(record.last_wake_at_ms);
  *out.mutable_next_wake_at()  = util::MillisToProto(record.next_wake_at_ms);
  out.set_wake_schedule(record.wake_schedule);
  return out;
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", "", [&] {
    StatsResponse resp;
    auto&         repo = *ctx_.repository;
    auto          tx   = repo.Begin();

    auto& by_state = *resp.mutable_wake_events_by_state();
    for (const auto& wake : repo.ListWakeEvents(*tx, "", 0)) {
      by_state[std::string(model::ToString(wake.state))] += 1;
    }
    auto& by_status = *resp.mutable_transfers_by_status();
    for (const auto& transfer : repo.ListTransfers(*tx)) {
      by_status[std::string(model::ToString(transfer.status))] += 1;
    }
    resp.set_stored_fragments(repo.CountFragments(*tx));
    resp.set_devices(repo.CountDevices(*tx));
    resp.set_failures(repo.ListFailures(*tx, "").size());
    tx->Commit();

    resp.set_queued_commands(ctx_.commands->Size());
    return resp;
  });
}

WakeEvent AdminService::GetWakeEvent(const GetWakeEventRequest& req) {
  return ObserveRpc("AdminService.GetWakeEvent", "", [&] {
    auto tx     = ctx_.repository->Begin();
    auto record = ctx_.repository->GetWakeEvent(*tx, req.id());
    tx->Commit();
    if (!record) throw util::NotFound("wake event not found: " + req.id());
    return ToProto(*record);
  });
}

ListWakeEventsResponse AdminService::ListWakeEvents(const ListWakeEventsRequest& req) {
  const auto device_id = req.device_id().empty() ? std::string{} : protocol::NormalizeDeviceId(req.device_id());
  return ObserveRpc("AdminService.ListWakeEvents", device_id, [&] {
    auto tx      = ctx_.repository->Begin();
    auto records = ctx_.repository->ListWakeEvents(*tx, device_id, req.limit());
    tx->Commit();

    ListWakeEventsResponse resp;
    for (const auto& record : records) {
      *resp.add_wake_events() = ToProto(record);
    }
    return resp;
  });
}

ImageTransfer AdminService::GetTransfer(const GetTransferRequest& req) {
  const auto device_id = protocol::NormalizeDeviceId(req.device_id());
  return ObserveRpc("AdminService.GetTransfer", device_id, [&] {
    auto tx     = ctx_.repository->Begin();
    auto record = ctx_.repository->GetTransfer(*tx, device_id, req.artifact_name());
    tx->Commit();
    if (!record) throw util::NotFound("transfer not found: " + device_id + "/" + req.artifact_name());
    return ToProto(*record);
  });
}

DeviceState AdminService::GetDevice(const GetDeviceRequest& req) {
  const auto device_id = protocol::NormalizeDeviceId(req.device_id());
  return ObserveRpc("AdminService.GetDevice", device_id, [&] {
    auto tx     = ctx_.repository->Begin();
    auto record = ctx_.repository->GetDevice(*tx, device_id);
    tx->Commit();
    if (!record) throw util::NotFound("device not found: " + device_id);
    return ToProto(*record);
  });
}

SweepNowResponse AdminService::SweepNow(const SweepNowRequest&) {
  return ObserveRpc("AdminService.SweepNow", "", [&] {
    auto result = ctx_.sweeper->SweepOnce(ctx_.now());

    SweepNowResponse resp;
    for (const auto& key : result.expired) {
      auto* expired = resp.add_expired();
      expired->set_device_id(key.device_id);
      expired->set_artifact_name(key.artifact_name);
    }
    resp.set_transfers_failed(result.transfers_failed);
    resp.set_wakes_failed(result.wakes_failed);
    resp.set_missing_requested(result.missing_requested);
    resp.set_rows_pruned(result.pruned.Total());
    return resp;
  });
}

} // namespace fieldwake::service
