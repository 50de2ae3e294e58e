#include "internal/lineage/lineage_cache.hpp"

#include <mutex>

namespace fieldwake::lineage {

LineageCache::LineageCache(std::shared_ptr<LineageResolver> inner, std::chrono::seconds ttl, util::NowFn now)
    : inner_(std::move(inner)), ttl_(ttl), now_(std::move(now)) {
}

std::optional<DeviceLineage> LineageCache::Resolve(const std::string& device_id) {
  const auto now = now_();
  {
    std::shared_lock lock(mutex_);
    const auto       it = entries_.find(device_id);
    if (it != entries_.end() && now - it->second.fetched_at < ttl_) {
      return it->second.lineage;
    }
  }

  // resolved outside the lock; concurrent misses may both hit inner_
  auto lineage = inner_->Resolve(device_id);

  std::unique_lock lock(mutex_);
  entries_[device_id] = Entry{lineage, now};
  return lineage;
}

void LineageCache::Invalidate(const std::string& device_id) {
  std::unique_lock lock(mutex_);
  entries_.erase(device_id);
}

void LineageCache::Clear() {
  std::unique_lock lock(mutex_);
  entries_.clear();
}

} // namespace fieldwake::lineage
