#include "internal/core/fragment_recovery.hpp"

#include <vector>

#include "internal/chunks/chunk_store.hpp"
#include "internal/command/command_publisher.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace fieldwake::core {

bool RequestMissingFragments(const EngineContext& ctx, const std::string& device_id, const std::string& artifact_name) {
  auto& repo = *ctx.repository;

  uint32_t total = 0;
  {
    auto tx       = repo.Begin();
    auto transfer = repo.GetTransfer(*tx, device_id, artifact_name);
    tx->Commit();
    if (!transfer || transfer->status != model::TransferStatus::kReceiving) return false;
    total = transfer->total_fragments;
  }

  // the chunk store runs its own transaction; the device lock keeps the transfer stable in between
  const auto missing = ctx.chunks->MissingIndices(device_id, artifact_name, total);
  if (missing.empty()) return false;

  uint32_t request = 0;
  {
    auto tx       = repo.Begin();
    auto transfer = repo.GetTransfer(*tx, device_id, artifact_name);
    if (!transfer || transfer->status != model::TransferStatus::kReceiving) {
      tx->Commit();
      return false;
    }
    if (transfer->missing_requests >= ctx.settings.max_missing_requests) {
      tx->Commit();
      FIELDWAKE_LOG_WARN("missing fragment request limit reached; waiting for ttl",
                         {observability::StringField("device_id", device_id), observability::StringField("artifact", artifact_name),
                          observability::IntField("missing", static_cast<int64_t>(missing.size()))});
      return false;
    }

    transfer->missing_requests += 1;
    transfer->recovery_boundary = missing.back();
    transfer->updated_at_ms     = util::ToUnixMillis(ctx.now());
    db::ThrowIfError(repo.UpsertTransfer(*tx, *transfer), "record missing request");
    tx->Commit();
    request = transfer->missing_requests;
  }

  FIELDWAKE_LOG_INFO("requesting missing fragments",
                     {observability::StringField("device_id", device_id), observability::StringField("artifact", artifact_name),
                      observability::IntField("missing", static_cast<int64_t>(missing.size())), observability::IntField("request", request)});

  observability::Metrics::Instance().RecordMissingIndices(missing.size());
  ctx.commands->PublishMissingFragments(device_id, artifact_name, missing);
  return true;
}

} // namespace fieldwake::core
