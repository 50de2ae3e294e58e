#include "internal/sweep/chunk_sweeper.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <vector>

#include "fakes/engine_fakes.hpp"
#include "internal/core/wake_router.hpp"

namespace {

using fieldwake::core::WakeRouter;
using fieldwake::model::FailureCode;
using fieldwake::model::ProtocolState;
using fieldwake::model::TransferStatus;
using fieldwake::sweep::ChunkSweeper;
using fieldwake::testing::TestEngine;

namespace protocol = fieldwake::protocol;

constexpr const char* kDevice = "AABBCCDDEEFF";

fieldwake::config::EngineSettings ShortTtl() {
  fieldwake::config::EngineSettings settings;
  settings.fragment_ttl = std::chrono::seconds(60);
  return settings;
}

std::string BeginTransfer(TestEngine& engine, WakeRouter& router, uint32_t total) {
  protocol::AliveMessage alive;
  alive.device_id = kDevice;
  router.Route(alive);
  const auto artifact = engine.publisher->captures.back().second;

  protocol::MetadataMessage metadata;
  metadata.device_id       = kDevice;
  metadata.artifact_name   = artifact;
  metadata.total_fragments = total;
  router.Route(metadata);
  return artifact;
}

void SendFragment(WakeRouter& router, const std::string& artifact, uint32_t index) {
  protocol::FragmentMessage fragment;
  fragment.device_id     = kDevice;
  fragment.artifact_name = artifact;
  fragment.index         = index;
  fragment.bytes         = "x";
  router.Route(fragment);
}

TransferStatus StatusOf(TestEngine& engine, const std::string& artifact) {
  auto tx       = engine.repository->Begin();
  auto transfer = engine.repository->GetTransfer(*tx, kDevice, artifact);
  tx->Commit();
  return transfer->status;
}

void TestIdleTransferExpiresAndReportsOnce() {
  TestEngine engine(ShortTtl());
  engine.lineage->Admit(kDevice);
  WakeRouter router(engine.context);

  const auto artifact = BeginTransfer(engine, router, 3);
  SendFragment(router, artifact, 0);

  ChunkSweeper sweeper(engine.context);

  engine.clock.Advance(std::chrono::seconds(30));
  auto result = sweeper.SweepOnce(engine.clock.Now());
  assert(result.expired.empty());
  assert(StatusOf(engine, artifact) == TransferStatus::kReceiving);

  engine.clock.Advance(std::chrono::seconds(31));
  result = sweeper.SweepOnce(engine.clock.Now());
  assert(result.expired.size() == 1);
  assert(result.transfers_failed == 1);
  assert(StatusOf(engine, artifact) == TransferStatus::kFailed);
  assert(engine.chunks->Count() == 0);

  assert(engine.notifier->failures.size() == 1);
  assert(engine.notifier->failures[0].code == FailureCode::kTransferExpired);
  assert(engine.notifier->failures[0].artifact_name == artifact);

  // the wake that asked for the artifact fails with it
  assert(result.wakes_failed == 1);
  {
    auto tx   = engine.repository->Begin();
    auto wake = engine.repository->LatestWakeEvent(*tx, kDevice);
    tx->Commit();
    assert(wake.has_value());
    assert(wake->state == ProtocolState::kFailed);
    assert(wake->failure_reason == "transfer_expired");
  }

  // a second pass finds nothing new
  engine.clock.Advance(std::chrono::seconds(120));
  result = sweeper.SweepOnce(engine.clock.Now());
  assert(result.transfers_failed == 0);
  assert(engine.notifier->failures.size() == 1);
}

void TestFreshFragmentsKeepTransferAlive() {
  TestEngine engine(ShortTtl());
  engine.lineage->Admit(kDevice);
  WakeRouter router(engine.context);

  const auto artifact = BeginTransfer(engine, router, 5);
  ChunkSweeper sweeper(engine.context);

  for (uint32_t index = 0; index < 3; ++index) {
    SendFragment(router, artifact, index);
    engine.clock.Advance(std::chrono::seconds(45));
    assert(sweeper.SweepOnce(engine.clock.Now()).expired.empty());
  }
  assert(StatusOf(engine, artifact) == TransferStatus::kReceiving);
}

void TestTransferWithoutFragmentsExpires() {
  TestEngine engine(ShortTtl());
  engine.lineage->Admit(kDevice);
  WakeRouter router(engine.context);

  const auto   artifact = BeginTransfer(engine, router, 4);
  ChunkSweeper sweeper(engine.context);

  engine.clock.Advance(std::chrono::seconds(61));
  const auto result = sweeper.SweepOnce(engine.clock.Now());
  assert(result.transfers_failed == 1);
  assert(StatusOf(engine, artifact) == TransferStatus::kFailed);
  assert(engine.notifier->failures.size() == 1);
}

void TestQuietTransferGetsTargetedRequest() {
  auto settings                 = ShortTtl();
  settings.recovery_delay       = std::chrono::seconds(15);
  settings.max_missing_requests = 2;
  TestEngine engine(settings);
  engine.lineage->Admit(kDevice);
  WakeRouter router(engine.context);

  // the tail fragment never arrives, so no pass ever ends
  const auto artifact = BeginTransfer(engine, router, 5);
  for (uint32_t index = 0; index < 4; ++index) SendFragment(router, artifact, index);
  assert(engine.publisher->missing_requests.empty());

  ChunkSweeper sweeper(engine.context);

  engine.clock.Advance(std::chrono::seconds(10));
  assert(sweeper.SweepOnce(engine.clock.Now()).missing_requested == 0);

  engine.clock.Advance(std::chrono::seconds(6));
  auto result = sweeper.SweepOnce(engine.clock.Now());
  assert(result.missing_requested == 1);
  assert(result.expired.empty());
  assert(engine.publisher->missing_requests.size() == 1);
  assert((engine.publisher->missing_requests[0].indices == std::vector<uint32_t>{4}));

  // the request restarts the quiet period
  assert(sweeper.SweepOnce(engine.clock.Now()).missing_requested == 0);

  engine.clock.Advance(std::chrono::seconds(16));
  assert(sweeper.SweepOnce(engine.clock.Now()).missing_requested == 1);
  assert(engine.publisher->missing_requests.size() == 2);

  // budget spent
  engine.clock.Advance(std::chrono::seconds(16));
  assert(sweeper.SweepOnce(engine.clock.Now()).missing_requested == 0);
  assert(engine.publisher->missing_requests.size() == 2);
  assert(StatusOf(engine, artifact) == TransferStatus::kReceiving);

  SendFragment(router, artifact, 4);
  assert(StatusOf(engine, artifact) == TransferStatus::kComplete);
  assert(engine.notifier->completed.size() == 1);
  assert(engine.notifier->failures.empty());
}

void TestFinishedRowsArePrunedAfterRetention() {
  auto settings      = ShortTtl();
  settings.retention = std::chrono::hours(1);
  TestEngine engine(settings);
  engine.lineage->Admit(kDevice);
  WakeRouter router(engine.context);

  const auto finished = BeginTransfer(engine, router, 1);
  SendFragment(router, finished, 0);
  assert(StatusOf(engine, finished) == TransferStatus::kComplete);

  ChunkSweeper sweeper(engine.context);
  assert(sweeper.SweepOnce(engine.clock.Now()).pruned.Total() == 0);

  engine.clock.Advance(std::chrono::hours(2));
  protocol::AliveMessage alive;
  alive.device_id = kDevice;
  router.Route(alive);

  const auto result = sweeper.SweepOnce(engine.clock.Now());
  assert(result.pruned.wake_events == 1);
  assert(result.pruned.transfers == 1);

  auto tx = engine.repository->Begin();
  assert(!engine.repository->GetTransfer(*tx, kDevice, finished).has_value());
  const auto wakes = engine.repository->ListWakeEvents(*tx, kDevice, 0);
  assert(wakes.size() == 1);
  assert(wakes[0].state == ProtocolState::kSnapSent);
  assert(engine.repository->GetDevice(*tx, kDevice).has_value());
  tx->Commit();
}

void TestStrayFragmentsExpireWithoutReport() {
  TestEngine engine(ShortTtl());
  engine.chunks->StoreFragment(kDevice, "orphan.jpg", 0, "x");

  ChunkSweeper sweeper(engine.context);
  engine.clock.Advance(std::chrono::seconds(61));
  const auto result = sweeper.SweepOnce(engine.clock.Now());

  assert(result.expired.size() == 1);
  assert(result.transfers_failed == 0);
  assert(engine.notifier->failures.empty());
}

void TestStartStopIsPrompt() {
  TestEngine   engine(ShortTtl());
  ChunkSweeper sweeper(engine.context);

  const auto started = std::chrono::steady_clock::now();
  sweeper.Start();
  sweeper.Start();
  sweeper.Stop();
  sweeper.Stop();
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
}

} // namespace

int main() {
  TestIdleTransferExpiresAndReportsOnce();
  TestFreshFragmentsKeepTransferAlive();
  TestTransferWithoutFragmentsExpires();
  TestQuietTransferGetsTargetedRequest();
  TestFinishedRowsArePrunedAfterRetention();
  TestStrayFragmentsExpireWithoutReport();
  TestStartStopIsPrompt();

  std::cout << "fieldwake_unit_chunk_sweeper: pass\n";
  return 0;
}
