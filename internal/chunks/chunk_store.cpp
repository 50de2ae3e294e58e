#include "internal/chunks/chunk_store.hpp"

#include <algorithm>

namespace fieldwake::chunks {

namespace {

// distinct stored indices that fall inside [0,total), ascending
std::vector<uint32_t> InRange(std::vector<uint32_t> indices, uint32_t total) {
  indices.erase(std::remove_if(indices.begin(), indices.end(), [total](uint32_t i) { return i >= total; }), indices.end());
  std::sort(indices.begin(), indices.end());
  indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
  return indices;
}

} // namespace

ChunkStore::ChunkStore(std::shared_ptr<db::Repository> repository, std::chrono::seconds ttl, util::NowFn now)
    : repository_(std::move(repository)), ttl_(ttl), now_(std::move(now)) {
}

bool ChunkStore::StoreFragment(const std::string& device_id, const std::string& artifact_name, uint32_t index, const std::string& bytes) {
  const auto now_ms     = util::ToUnixMillis(now_());
  const auto expires_ms = now_ms + static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(ttl_).count());

  db::model::FragmentRecord record;
  record.device_id     = device_id;
  record.artifact_name = artifact_name;
  record.index         = index;
  record.bytes         = bytes;
  record.stored_at_ms  = now_ms;
  record.expires_at_ms = expires_ms;

  auto       tx     = repository_->Begin();
  const auto result = repository_->InsertFragment(*tx, record);
  if (result.code == db::ErrorCode::AlreadyExists) {
    tx->Rollback();
    return false;
  }
  db::ThrowIfError(result, "store fragment " + device_id + "/" + artifact_name + "#" + std::to_string(index));
  db::ThrowIfError(repository_->TouchFragments(*tx, device_id, artifact_name, expires_ms), "refresh fragment expiry");
  tx->Commit();
  return true;
}

bool ChunkStore::IsComplete(const std::string& device_id, const std::string& artifact_name, uint32_t total) {
  if (total == 0) return false;
  auto tx      = repository_->Begin();
  auto indices = InRange(repository_->ListFragmentIndices(*tx, device_id, artifact_name), total);
  tx->Commit();
  return indices.size() == total;
}

std::vector<uint32_t> ChunkStore::MissingIndices(const std::string& device_id, const std::string& artifact_name, uint32_t total) {
  auto tx      = repository_->Begin();
  auto present = InRange(repository_->ListFragmentIndices(*tx, device_id, artifact_name), total);
  tx->Commit();

  std::vector<uint32_t> missing;
  auto                  it = present.begin();
  for (uint32_t i = 0; i < total; ++i) {
    if (it != present.end() && *it == i) {
      ++it;
      continue;
    }
    missing.push_back(i);
  }
  return missing;
}

std::string ChunkStore::Assemble(const std::string& device_id, const std::string& artifact_name, uint32_t total) {
  if (total == 0) throw AssemblyError("artifact " + artifact_name + " declares zero fragments");

  auto tx        = repository_->Begin();
  auto fragments = repository_->ListFragments(*tx, device_id, artifact_name);
  tx->Commit();

  std::string out;
  uint32_t    expected = 0;
  for (const auto& fragment : fragments) {
    if (fragment.index >= total) break;
    if (fragment.index != expected) {
      throw AssemblyError("artifact " + artifact_name + " is missing fragment " + std::to_string(expected));
    }
    out += fragment.bytes;
    ++expected;
  }
  if (expected != total) {
    throw AssemblyError("artifact " + artifact_name + " is missing fragment " + std::to_string(expected));
  }
  return out;
}

std::size_t ChunkStore::Clear(const std::string& device_id, const std::string& artifact_name) {
  std::size_t deleted = 0;
  auto        tx      = repository_->Begin();
  db::ThrowIfError(repository_->DeleteFragments(*tx, device_id, artifact_name, deleted), "clear fragments " + device_id + "/" + artifact_name);
  tx->Commit();
  return deleted;
}

bool ChunkStore::HasFragments(const std::string& device_id, const std::string& artifact_name) {
  auto       tx      = repository_->Begin();
  const bool present = !repository_->ListFragmentIndices(*tx, device_id, artifact_name).empty();
  tx->Commit();
  return present;
}

std::vector<db::model::FragmentKey> ChunkStore::SweepExpired(util::TimePoint now) {
  std::vector<db::model::FragmentKey> removed;
  auto                                tx = repository_->Begin();
  db::ThrowIfError(repository_->DeleteExpiredFragments(*tx, util::ToUnixMillis(now), removed), "sweep expired fragments");
  tx->Commit();
  return removed;
}

uint64_t ChunkStore::Count() {
  auto       tx    = repository_->Begin();
  const auto count = repository_->CountFragments(*tx);
  tx->Commit();
  return count;
}

} // namespace fieldwake::chunks
