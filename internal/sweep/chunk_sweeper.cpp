#include "internal/sweep/chunk_sweeper.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <optional>
#include <string>

#include "internal/chunks/chunk_store.hpp"
#include "internal/core/device_locks.hpp"
#include "internal/core/fragment_recovery.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/protocol_state.hpp"
#include "internal/notify/failure_reporter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace fieldwake::sweep {

ChunkSweeper::ChunkSweeper(core::EngineContext context) : ctx_(std::move(context)) {
}

ChunkSweeper::~ChunkSweeper() {
  Stop();
}

void ChunkSweeper::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&ChunkSweeper::Run, this);
}

void ChunkSweeper::Stop() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    running_ = false;
  }
  wait_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ChunkSweeper::Run() {
  while (running_) {
    {
      std::unique_lock<std::mutex> lock(wait_mutex_);
      wait_cv_.wait_for(lock, ctx_.settings.sweep_interval, [this] { return !running_; });
    }
    if (!running_) break;

    try {
      SweepOnce(ctx_.now());
    } catch (const std::exception& e) {
      FIELDWAKE_LOG_ERROR("chunk sweep failed", {observability::StringField("error", e.what())});
    }
  }
}

namespace {

uint64_t Millis(std::chrono::seconds d) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(d).count());
}

} // namespace

SweepResult ChunkSweeper::SweepOnce(util::TimePoint now) {
  observability::SpanScope span("ChunkSweeper.SweepOnce");

  SweepResult result;
  result.expired = ctx_.chunks->SweepExpired(now);

  const auto ttl_ms      = Millis(ctx_.settings.fragment_ttl);
  const auto recovery_ms = Millis(ctx_.settings.recovery_delay);
  const auto now_ms      = util::ToUnixMillis(now);

  std::vector<db::model::FragmentKey> quiet;
  {
    auto tx = ctx_.repository->Begin();
    for (const auto& transfer : ctx_.repository->ListReceivingTransfers(*tx)) {
      db::model::FragmentKey key{transfer.device_id, transfer.artifact_name};
      if (std::find(result.expired.begin(), result.expired.end(), key) != result.expired.end()) continue;

      const auto idle_since = std::max(transfer.updated_at_ms, transfer.created_at_ms);
      if (transfer.last_fragment_at_ms != 0) {
        if (idle_since + recovery_ms <= now_ms && transfer.missing_requests < ctx_.settings.max_missing_requests) {
          quiet.push_back(std::move(key));
        }
        continue;
      }

      // declared metadata but never delivered a fragment
      if (idle_since + ttl_ms > now_ms) continue;
      if (!ctx_.repository->ListFragmentIndices(*tx, transfer.device_id, transfer.artifact_name).empty()) continue;
      result.expired.push_back(std::move(key));
    }
    tx->Commit();
  }

  for (const auto& key : result.expired) {
    bool wake_failed = false;
    if (ExpireTransfer(key, now, wake_failed)) ++result.transfers_failed;
    if (wake_failed) ++result.wakes_failed;
  }
  for (const auto& key : quiet) {
    if (RecoverTransfer(key, now)) ++result.missing_requested;
  }

  const auto retention_ms = Millis(ctx_.settings.retention);
  if (retention_ms != 0 && now_ms > retention_ms) {
    auto tx = ctx_.repository->Begin();
    db::ThrowIfError(ctx_.repository->PruneBefore(*tx, now_ms - retention_ms, result.pruned), "prune finished rows");
    tx->Commit();
  }

  span.SetAttribute("sweep.expired", static_cast<int64_t>(result.expired.size()));
  span.SetAttribute("sweep.transfers_failed", static_cast<int64_t>(result.transfers_failed));
  span.SetAttribute("sweep.missing_requested", static_cast<int64_t>(result.missing_requested));
  span.SetAttribute("sweep.pruned", static_cast<int64_t>(result.pruned.Total()));
  if (!result.expired.empty() || result.missing_requested != 0) {
    FIELDWAKE_LOG_INFO("chunk sweep", {observability::IntField("expired", static_cast<int64_t>(result.expired.size())),
                                       observability::IntField("transfers_failed", result.transfers_failed),
                                       observability::IntField("wakes_failed", result.wakes_failed),
                                       observability::IntField("missing_requested", result.missing_requested)});
  }
  if (result.pruned.Total() != 0) {
    FIELDWAKE_LOG_INFO("pruned rows past retention", {observability::IntField("wake_events", static_cast<int64_t>(result.pruned.wake_events)),
                                                      observability::IntField("transfers", static_cast<int64_t>(result.pruned.transfers)),
                                                      observability::IntField("failures", static_cast<int64_t>(result.pruned.failures)),
                                                      observability::IntField("artifact_links", static_cast<int64_t>(result.pruned.artifact_links))});
  }
  observability::Metrics::Instance().RecordExpiredTransfers(result.transfers_failed);
  return result;
}

bool ChunkSweeper::RecoverTransfer(const db::model::FragmentKey& key, util::TimePoint now) {
  auto                        device_mutex = ctx_.locks->For(key.device_id);
  std::lock_guard<std::mutex> lock(*device_mutex);

  // a fragment may have landed since the scan
  {
    auto tx       = ctx_.repository->Begin();
    auto transfer = ctx_.repository->GetTransfer(*tx, key.device_id, key.artifact_name);
    tx->Commit();
    if (!transfer || transfer->status != model::TransferStatus::kReceiving) return false;
    if (transfer->updated_at_ms + Millis(ctx_.settings.recovery_delay) > util::ToUnixMillis(now)) return false;
  }
  return core::RequestMissingFragments(ctx_, key.device_id, key.artifact_name);
}

bool ChunkSweeper::ExpireTransfer(const db::model::FragmentKey& key, util::TimePoint now, bool& wake_failed) {
  auto                        device_mutex = ctx_.locks->For(key.device_id);
  std::lock_guard<std::mutex> lock(*device_mutex);

  wake_failed = false;
  db::model::ImageTransferRecord transfer;
  {
    auto& repo     = *ctx_.repository;
    auto  tx       = repo.Begin();
    auto  existing = repo.GetTransfer(*tx, key.device_id, key.artifact_name);
    if (!existing || existing->status != model::TransferStatus::kReceiving) {
      tx->Commit();
      return false;
    }
    transfer               = *existing;
    transfer.status        = model::TransferStatus::kFailed;
    transfer.failure_code  = model::FailureCode::kTransferExpired;
    transfer.updated_at_ms = util::ToUnixMillis(now);
    db::ThrowIfError(repo.UpsertTransfer(*tx, transfer), "expire transfer");

    // the wake that asked for this artifact fails with it
    std::optional<db::model::WakeEventRecord> wake;
    if (!transfer.wake_event_id.empty()) {
      wake = repo.GetWakeEvent(*tx, transfer.wake_event_id);
    } else {
      wake = repo.LatestWakeEvent(*tx, transfer.device_id);
      if (wake && wake->artifact_name != transfer.artifact_name) wake.reset();
    }
    if (wake && !model::IsTerminal(wake->state)) {
      model::RequireTransition(wake->state, model::ProtocolState::kFailed);
      wake->state          = model::ProtocolState::kFailed;
      wake->failure_reason = std::string(model::ToString(model::FailureCode::kTransferExpired));
      db::ThrowIfError(repo.UpdateWakeEvent(*tx, *wake), "fail expired wake");
      wake_failed = true;
    }
    tx->Commit();
  }

  if (wake_failed) {
    FIELDWAKE_LOG_WARN("wake failed by expired transfer",
                       {observability::StringField("device_id", transfer.device_id), observability::StringField("artifact", transfer.artifact_name),
                        observability::StringField("wake_event_id", transfer.wake_event_id)});
  }

  notify::FailureReport report;
  report.device_id     = transfer.device_id;
  report.artifact_name = transfer.artifact_name;
  report.wake_event_id = transfer.wake_event_id;
  report.code          = model::FailureCode::kTransferExpired;
  report.message       = "no fragment received for " + std::to_string(ctx_.settings.fragment_ttl.count()) + "s; received " +
                   std::to_string(transfer.received_fragments) + "/" + std::to_string(transfer.total_fragments);
  report.reported_at = now;

  try {
    ctx_.failures->Report(report);
  } catch (const std::exception& e) {
    FIELDWAKE_LOG_ERROR("failure report could not be delivered",
                        {observability::StringField("device_id", transfer.device_id), observability::StringField("artifact", transfer.artifact_name),
                         observability::StringField("error", e.what())});
  }
  return true;
}

} // namespace fieldwake::sweep
