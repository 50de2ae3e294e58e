#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace fieldwake::chunks {

// Assemble() was asked for an artifact that is not fully present.
class AssemblyError : public std::runtime_error {
 public:
  explicit AssemblyError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  ChunkStore

  Idempotent fragment store keyed by (device, artifact, index), persisted
  through the repository so deduplication survives a restart.

  Every newly stored fragment pushes the expiry of the whole artifact to
  now + ttl: an artifact expires only after ttl without fresh data.

  Each call runs in its own transaction; do not call from inside one.
*/
class ChunkStore {
 public:
  ChunkStore(std::shared_ptr<db::Repository> repository, std::chrono::seconds ttl, util::NowFn now = util::Now);

  // true when this call stored the fragment, false for a redelivery
  bool StoreFragment(const std::string& device_id, const std::string& artifact_name, uint32_t index, const std::string& bytes);

  bool IsComplete(const std::string& device_id, const std::string& artifact_name, uint32_t total);

  std::vector<uint32_t> MissingIndices(const std::string& device_id, const std::string& artifact_name, uint32_t total);

  // Throws AssemblyError when total is zero or an index in [0,total) is absent.
  std::string Assemble(const std::string& device_id, const std::string& artifact_name, uint32_t total);

  std::size_t Clear(const std::string& device_id, const std::string& artifact_name);

  bool HasFragments(const std::string& device_id, const std::string& artifact_name);

  // Deletes fragments whose expiry is at or before `now`.
  std::vector<db::model::FragmentKey> SweepExpired(util::TimePoint now);

  uint64_t Count();

 private:
  std::shared_ptr<db::Repository> repository_;
  std::chrono::seconds            ttl_;
  util::NowFn                     now_;
};

} // namespace fieldwake::chunks
