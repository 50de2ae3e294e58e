#pragma once

#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/lineage/lineage_resolver.hpp"
#include "internal/util/time.hpp"

namespace fieldwake::lineage {

/*
  LineageCache

  TTL cache in front of another resolver. Unknown devices are cached too,
  so a chatty unprovisioned device does not hit the registry every wake.
*/
class LineageCache final : public LineageResolver {
 public:
  LineageCache(std::shared_ptr<LineageResolver> inner, std::chrono::seconds ttl, util::NowFn now = util::Now);

  std::optional<DeviceLineage> Resolve(const std::string& device_id) override;

  void Invalidate(const std::string& device_id);
  void Clear();

 private:
  struct Entry {
    std::optional<DeviceLineage> lineage;
    util::TimePoint              fetched_at;
  };

  std::shared_ptr<LineageResolver> inner_;
  std::chrono::seconds             ttl_;
  util::NowFn                      now_;

  mutable std::shared_mutex              mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace fieldwake::lineage
