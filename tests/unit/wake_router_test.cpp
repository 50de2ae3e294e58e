#include "internal/core/wake_router.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "fakes/engine_fakes.hpp"
#include "internal/model/protocol_state.hpp"
#include "internal/protocol/inbound_message.hpp"

namespace {

using fieldwake::core::Disposition;
using fieldwake::core::WakeRouter;
using fieldwake::model::FailureCode;
using fieldwake::model::ProtocolState;
using fieldwake::model::TransferStatus;
using fieldwake::testing::TestEngine;

namespace protocol = fieldwake::protocol;

constexpr const char* kDevice = "AABBCCDDEEFF";

const std::vector<std::string> kChunks = {"\xFF\xD8", "head", "body", "tail", "\xFF\xD9"};

protocol::AliveMessage Alive(const std::string& device_id = kDevice) {
  protocol::AliveMessage msg;
  msg.device_id       = device_id;
  msg.pending_count   = 1;
  msg.battery_voltage = 3.9;
  msg.wifi_rssi       = -60;
  return msg;
}

protocol::MetadataMessage Metadata(const std::string& artifact, uint32_t total) {
  protocol::MetadataMessage msg;
  msg.device_id       = kDevice;
  msg.artifact_name   = artifact;
  msg.total_fragments = total;
  msg.max_chunk_size  = 4;
  return msg;
}

protocol::FragmentMessage Fragment(const std::string& artifact, uint32_t index) {
  protocol::FragmentMessage msg;
  msg.device_id     = kDevice;
  msg.artifact_name = artifact;
  msg.index         = index;
  msg.bytes         = kChunks.at(index);
  return msg;
}

std::string Joined() {
  std::string out;
  for (const auto& chunk : kChunks) out += chunk;
  return out;
}

fieldwake::db::model::WakeEventRecord LatestWake(TestEngine& engine, const std::string& device_id = kDevice) {
  auto tx   = engine.repository->Begin();
  auto wake = engine.repository->LatestWakeEvent(*tx, device_id);
  tx->Commit();
  assert(wake.has_value());
  return *wake;
}

fieldwake::db::model::ImageTransferRecord Transfer(TestEngine& engine, const std::string& artifact) {
  auto tx       = engine.repository->Begin();
  auto transfer = engine.repository->GetTransfer(*tx, kDevice, artifact);
  tx->Commit();
  assert(transfer.has_value());
  return *transfer;
}

// Admitted device wakes and returns the artifact name the capture request carried.
std::string StartWake(TestEngine& engine, WakeRouter& router) {
  const auto result = router.Route(Alive());
  assert(result.disposition == Disposition::kAccepted);
  assert(result.detail == "capture_requested");
  assert(!engine.publisher->captures.empty());
  return engine.publisher->captures.back().second;
}

void TestRecoveryRoundTripCompletesOnce() {
  TestEngine engine;
  engine.lineage->Admit(kDevice);
  WakeRouter router(engine.context);

  const auto artifact = StartWake(engine, router);
  assert(artifact == std::string(kDevice) + "_1700000000000.jpg");

  auto wake = LatestWake(engine);
  assert(wake.state == ProtocolState::kSnapSent);
  assert(wake.images_requested == 1);
  assert(wake.artifact_name == artifact);

  assert(router.Route(Metadata(artifact, 5)).detail == "receiving");
  assert(LatestWake(engine).metadata_at_ms != 0);

  for (uint32_t index : {0u, 1u, 2u, 4u}) {
    const auto result = router.Route(Fragment(artifact, index));
    assert(result.disposition == Disposition::kAccepted);
  }

  // the pass ended at the last index with a gap at 3
  assert(engine.publisher->missing_requests.size() == 1);
  assert((engine.publisher->missing_requests[0].indices == std::vector<uint32_t>{3}));
  auto transfer = Transfer(engine, artifact);
  assert(transfer.received_fragments == 4);
  assert(transfer.missing_requests == 1);
  assert(transfer.recovery_boundary == 3);
  assert(transfer.wake_event_id == wake.id);

  const auto done = router.Route(Fragment(artifact, 3));
  assert(done.disposition == Disposition::kAccepted);
  assert(done.detail == "finalized");

  assert(engine.artifacts->puts == 1);
  const auto key = "acme/north-field/" + std::string(kDevice) + "/" + artifact;
  assert(engine.artifacts->objects.at(key) == Joined());

  assert(engine.notifier->completed.size() == 1);
  assert(engine.notifier->completed[0].site_id == "north-field");
  assert(engine.notifier->completed[0].size_bytes == Joined().size());
  assert(engine.notifier->failures.empty());

  assert(engine.publisher->sleeps.size() == 1);
  assert(engine.publisher->sleeps[0].second == "8:00AM");

  transfer = Transfer(engine, artifact);
  assert(transfer.status == TransferStatus::kComplete);
  assert(transfer.storage_location == "mem://" + key);

  wake = LatestWake(engine);
  assert(wake.state == ProtocolState::kComplete);
  assert(wake.is_complete);
  assert(wake.images_completed == 1);
  assert(wake.next_wake_display == "8:00AM");
  assert(engine.chunks->Count() == 0);

  // redeliveries after completion change nothing
  const auto late_fragment = router.Route(Fragment(artifact, 3));
  assert(late_fragment.disposition == Disposition::kDuplicate);
  assert(engine.chunks->Count() == 0);

  const auto late_metadata = router.Route(Metadata(artifact, 5));
  assert(late_metadata.disposition == Disposition::kDuplicate);

  assert(engine.artifacts->puts == 1);
  assert(engine.notifier->completed.size() == 1);
  assert(engine.publisher->sleeps.size() == 1);
}

void TestUnmappedDeviceOnlySleeps() {
  TestEngine engine;
  WakeRouter router(engine.context);

  const auto result = router.Route(Alive("112233445566"));
  assert(result.disposition == Disposition::kAccepted);
  assert(result.detail == "sleep_only");
  assert(engine.publisher->captures.empty());
  assert(engine.publisher->sleeps.size() == 1);
  assert(engine.publisher->sleeps[0].second == "8:00AM");

  const auto wake = LatestWake(engine, "112233445566");
  assert(wake.state == ProtocolState::kSleepOnly);
  assert(wake.artifact_name.empty());
  assert(wake.sleep_sent_at_ms != 0);

  auto tx     = engine.repository->Begin();
  auto device = engine.repository->GetDevice(*tx, "112233445566");
  tx->Commit();
  assert(device.has_value());
  assert(device->provisioning_status == "pending_mapping");
  assert(device->battery_health_percent.has_value());
  assert(device->wifi_rssi == -60);
}

void TestUnapprovedDeviceIsPendingApproval() {
  TestEngine engine;
  engine.lineage->Admit(kDevice);
  engine.lineage->devices[kDevice].approved = false;
  WakeRouter router(engine.context);

  assert(router.Route(Alive()).detail == "sleep_only");

  auto tx     = engine.repository->Begin();
  auto device = engine.repository->GetDevice(*tx, kDevice);
  tx->Commit();
  assert(device->provisioning_status == "pending_approval");
}

void TestNewHelloSupersedesInFlightWake() {
  TestEngine engine;
  engine.lineage->Admit(kDevice);
  WakeRouter router(engine.context);

  StartWake(engine, router);
  const auto first = LatestWake(engine);

  engine.clock.Advance(std::chrono::minutes(5));
  StartWake(engine, router);

  auto tx       = engine.repository->Begin();
  auto previous = engine.repository->GetWakeEvent(*tx, first.id);
  tx->Commit();
  assert(previous->state == ProtocolState::kFailed);
  assert(previous->failure_reason == "superseded_by_new_wake");
  assert(LatestWake(engine).state == ProtocolState::kSnapSent);
  assert(engine.publisher->captures.size() == 2);
}

void TestFragmentsBeforeMetadataFinalizeOnMetadata() {
  TestEngine engine;
  engine.lineage->Admit(kDevice);
  WakeRouter router(engine.context);
  const auto artifact = StartWake(engine, router);

  assert(router.Route(Fragment(artifact, 1)).detail == "stored before metadata");
  assert(router.Route(Fragment(artifact, 0)).detail == "stored before metadata");

  const auto result = router.Route(Metadata(artifact, 2));
  assert(result.detail == "finalized");
  assert(engine.artifacts->objects.begin()->second == kChunks[0] + kChunks[1]);
  assert(LatestWake(engine).state == ProtocolState::kComplete);
}

void TestDuplicateFragmentIsAbsorbed() {
  TestEngine engine;
  engine.lineage->Admit(kDevice);
  WakeRouter router(engine.context);
  const auto artifact = StartWake(engine, router);

  router.Route(Metadata(artifact, 5));
  router.Route(Fragment(artifact, 0));
  const auto again = router.Route(Fragment(artifact, 0));

  assert(again.disposition == Disposition::kDuplicate);
  assert(Transfer(engine, artifact).received_fragments == 1);
}

void TestMissingRequestsRespectBudget() {
  fieldwake::config::EngineSettings settings;
  settings.max_missing_requests = 1;
  TestEngine engine(settings);
  engine.lineage->Admit(kDevice);
  WakeRouter router(engine.context);
  const auto artifact = StartWake(engine, router);

  router.Route(Metadata(artifact, 4));
  router.Route(Fragment(artifact, 0));
  router.Route(Fragment(artifact, 3));

  assert(engine.publisher->missing_requests.size() == 1);
  assert((engine.publisher->missing_requests[0].indices == std::vector<uint32_t>{1, 2}));
  assert(Transfer(engine, artifact).recovery_boundary == 2);

  // index 2 closes the recovery pass; 1 is still missing but the budget is spent
  router.Route(Fragment(artifact, 2));
  assert(engine.publisher->missing_requests.size() == 1);

  const auto transfer = Transfer(engine, artifact);
  assert(transfer.status == TransferStatus::kReceiving);
  assert(transfer.missing_requests == 1);
}

void TestRepeatedMetadataRequestsLostTail() {
  TestEngine engine;
  engine.lineage->Admit(kDevice);
  WakeRouter router(engine.context);
  const auto artifact = StartWake(engine, router);

  router.Route(Metadata(artifact, 5));
  for (uint32_t index : {0u, 1u, 2u, 3u}) router.Route(Fragment(artifact, index));

  // the last index never arrived, so no pass has ended yet
  assert(engine.publisher->missing_requests.empty());

  // the device finished its pass and announces the image again
  const auto resent = router.Route(Metadata(artifact, 5));
  assert(resent.disposition == Disposition::kAccepted);
  assert(resent.detail == "missing_requested");
  assert(engine.publisher->missing_requests.size() == 1);
  assert((engine.publisher->missing_requests[0].indices == std::vector<uint32_t>{4}));

  auto transfer = Transfer(engine, artifact);
  assert(transfer.status == TransferStatus::kReceiving);
  assert(transfer.missing_requests == 1);
  assert(transfer.recovery_boundary == 4);

  const auto done = router.Route(Fragment(artifact, 4));
  assert(done.detail == "finalized");
  assert(engine.artifacts->puts == 1);
  assert(engine.notifier->completed.size() == 1);
  assert(LatestWake(engine).state == ProtocolState::kComplete);
}

void TestFailedTransferIsReopenedByMetadata() {
  TestEngine engine;
  engine.lineage->Admit(kDevice);
  WakeRouter router(engine.context);
  const auto artifact = StartWake(engine, router);

  engine.artifacts->fail_puts = true;
  router.Route(Metadata(artifact, 2));
  router.Route(Fragment(artifact, 0));
  const auto failed = router.Route(Fragment(artifact, 1));
  assert(failed.detail == "failed");

  auto transfer = Transfer(engine, artifact);
  assert(transfer.status == TransferStatus::kFailed);
  assert(transfer.failure_code == FailureCode::kUploadFailed);
  assert(engine.notifier->failures.size() == 1);
  assert(engine.notifier->failures[0].code == FailureCode::kUploadFailed);
  assert(engine.publisher->sleeps.empty());

  engine.artifacts->fail_puts = false;
  const auto retried = router.Route(Metadata(artifact, 2));
  assert(retried.detail == "finalized");

  transfer = Transfer(engine, artifact);
  assert(transfer.status == TransferStatus::kComplete);
  assert(transfer.retry_count == 1);
  assert(transfer.failure_code == FailureCode::kNone);
  assert(LatestWake(engine).state == ProtocolState::kComplete);
  assert(engine.publisher->sleeps.size() == 1);
}

void TestTelemetryOnlyTouchesDevice() {
  TestEngine engine;
  WakeRouter router(engine.context);

  protocol::TelemetryMessage telemetry;
  telemetry.device_id               = kDevice;
  telemetry.environment.temperature = 21.5;
  telemetry.environment.humidity    = 40.0;

  const auto result = router.Route(telemetry);
  assert(result.detail == "telemetry");

  auto tx     = engine.repository->Begin();
  auto device = engine.repository->GetDevice(*tx, kDevice);
  auto wakes  = engine.repository->ListWakeEvents(*tx, kDevice, 0);
  tx->Commit();
  assert(device.has_value());
  assert(device->temperature == 21.5);
  assert(wakes.empty());
  assert(engine.publisher->captures.empty() && engine.publisher->sleeps.empty());
}

} // namespace

int main() {
  TestRecoveryRoundTripCompletesOnce();
  TestUnmappedDeviceOnlySleeps();
  TestUnapprovedDeviceIsPendingApproval();
  TestNewHelloSupersedesInFlightWake();
  TestFragmentsBeforeMetadataFinalizeOnMetadata();
  TestDuplicateFragmentIsAbsorbed();
  TestMissingRequestsRespectBudget();
  TestRepeatedMetadataRequestsLostTail();
  TestFailedTransferIsReopenedByMetadata();
  TestTelemetryOnlyTouchesDevice();

  std::cout << "fieldwake_unit_wake_router: pass\n";
  return 0;
}
