#include "memory_repository.hpp"

#include <algorithm>
#include <set>

#include "memory_tx.hpp"

namespace fieldwake::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Wake events
// ------------------------------------------------------------------

Result MemoryRepository::InsertWakeEvent(Transaction& t, const model::WakeEventRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.wake_events.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.wake_events[r.id] = r;
  s.wake_order.push_back(r.id);
  return Result::Ok();
}

Result MemoryRepository::UpdateWakeEvent(Transaction& t, const model::WakeEventRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.wake_events.find(r.id);
  if (it == s.wake_events.end()) return Result::Err(ErrorCode::NotFound, "wake event " + r.id);
  it->second = r;
  return Result::Ok();
}

std::optional<model::WakeEventRecord> MemoryRepository::GetWakeEvent(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.wake_events.find(id);
  if (it == s.wake_events.end()) return std::nullopt;
  return it->second;
}

std::optional<model::WakeEventRecord> MemoryRepository::LatestWakeEvent(Transaction& t, const std::string& device_id) {
  const auto&                           s = TX(t).View();
  std::optional<model::WakeEventRecord> latest;
  for (const auto& id : s.wake_order) {
    const auto& rec = s.wake_events.at(id);
    if (rec.device_id != device_id) continue;
    if (!latest || rec.hello_at_ms >= latest->hello_at_ms) latest = rec;
  }
  return latest;
}

std::vector<model::WakeEventRecord> MemoryRepository::ListWakeEvents(Transaction& t, const std::string& device_id, std::size_t limit) {
  const auto&                         s = TX(t).View();
  std::vector<model::WakeEventRecord> out;
  for (auto it = s.wake_order.rbegin(); it != s.wake_order.rend(); ++it) {
    const auto& rec = s.wake_events.at(*it);
    if (!device_id.empty() && rec.device_id != device_id) continue;
    out.push_back(rec);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.hello_at_ms > b.hello_at_ms; });
  if (limit != 0 && out.size() > limit) out.resize(limit);
  return out;
}

// ------------------------------------------------------------------
// Transfers
// ------------------------------------------------------------------

Result MemoryRepository::UpsertTransfer(Transaction& t, const model::ImageTransferRecord& r) {
  TX(t).Mutable().transfers[{r.device_id, r.artifact_name}] = r;
  return Result::Ok();
}

std::optional<model::ImageTransferRecord> MemoryRepository::GetTransfer(Transaction& t, const std::string& device_id,
                                                                        const std::string& artifact_name) {
  const auto& s  = TX(t).View();
  auto        it = s.transfers.find({device_id, artifact_name});
  if (it == s.transfers.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ImageTransferRecord> MemoryRepository::ListTransfers(Transaction& t) {
  std::vector<model::ImageTransferRecord> out;
  for (const auto& [_, rec] : TX(t).View().transfers) out.push_back(rec);
  return out;
}

std::vector<model::ImageTransferRecord> MemoryRepository::ListReceivingTransfers(Transaction& t) {
  std::vector<model::ImageTransferRecord> out;
  for (const auto& [_, rec] : TX(t).View().transfers)
    if (rec.status == fieldwake::model::TransferStatus::kReceiving) out.push_back(rec);
  return out;
}

// ------------------------------------------------------------------
// Fragments
// ------------------------------------------------------------------

Result MemoryRepository::InsertFragment(Transaction& t, const model::FragmentRecord& r) {
  auto& s                 = TX(t).Mutable();
  auto [_, inserted]      = s.fragments.try_emplace({r.device_id, r.artifact_name, r.index}, r);
  if (!inserted) return Result::Err(ErrorCode::AlreadyExists);
  return Result::Ok();
}

std::vector<uint32_t> MemoryRepository::ListFragmentIndices(Transaction& t, const std::string& device_id, const std::string& artifact_name) {
  std::vector<uint32_t> out;
  for (const auto& rec : ListFragments(t, device_id, artifact_name)) out.push_back(rec.index);
  return out;
}

std::vector<model::FragmentRecord> MemoryRepository::ListFragments(Transaction& t, const std::string& device_id,
                                                                   const std::string& artifact_name) {
  const auto&                        s = TX(t).View();
  std::vector<model::FragmentRecord> out;
  // keys sort by (device, artifact, index), so the artifact is one contiguous run
  for (auto it = s.fragments.lower_bound({device_id, artifact_name, 0}); it != s.fragments.end(); ++it) {
    if (std::get<0>(it->first) != device_id || std::get<1>(it->first) != artifact_name) break;
    out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::TouchFragments(Transaction& t, const std::string& device_id, const std::string& artifact_name,
                                        uint64_t expires_at_ms) {
  auto& s = TX(t).Mutable();
  for (auto it = s.fragments.lower_bound({device_id, artifact_name, 0}); it != s.fragments.end(); ++it) {
    if (std::get<0>(it->first) != device_id || std::get<1>(it->first) != artifact_name) break;
    it->second.expires_at_ms = expires_at_ms;
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteFragments(Transaction& t, const std::string& device_id, const std::string& artifact_name,
                                         std::size_t& deleted) {
  auto& s = TX(t).Mutable();
  deleted = 0;
  auto it = s.fragments.lower_bound({device_id, artifact_name, 0});
  while (it != s.fragments.end() && std::get<0>(it->first) == device_id && std::get<1>(it->first) == artifact_name) {
    it = s.fragments.erase(it);
    ++deleted;
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteExpiredFragments(Transaction& t, uint64_t now_ms, std::vector<model::FragmentKey>& removed) {
  auto&                 s = TX(t).Mutable();
  std::set<ArtifactKey> keys;
  for (auto it = s.fragments.begin(); it != s.fragments.end();) {
    if (it->second.expires_at_ms <= now_ms) {
      keys.emplace(std::get<0>(it->first), std::get<1>(it->first));
      it = s.fragments.erase(it);
    } else {
      ++it;
    }
  }
  removed.clear();
  for (const auto& [device_id, artifact_name] : keys) removed.push_back({device_id, artifact_name});
  return Result::Ok();
}

uint64_t MemoryRepository::CountFragments(Transaction& t) {
  return TX(t).View().fragments.size();
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result MemoryRepository::UpsertDevice(Transaction& t, const model::DeviceRecord& r) {
  TX(t).Mutable().devices[r.device_id] = r;
  return Result::Ok();
}

std::optional<model::DeviceRecord> MemoryRepository::GetDevice(Transaction& t, const std::string& device_id) {
  const auto& s  = TX(t).View();
  auto        it = s.devices.find(device_id);
  if (it == s.devices.end()) return std::nullopt;
  return it->second;
}

uint64_t MemoryRepository::CountDevices(Transaction& t) {
  return TX(t).View().devices.size();
}

// ------------------------------------------------------------------
// Journals
// ------------------------------------------------------------------

Result MemoryRepository::InsertFailure(Transaction& t, const model::FailureRecord& r) {
  TX(t).Mutable().failures.push_back(r);
  return Result::Ok();
}

std::vector<model::FailureRecord> MemoryRepository::ListFailures(Transaction& t, const std::string& device_id) {
  std::vector<model::FailureRecord> out;
  for (const auto& rec : TX(t).View().failures)
    if (device_id.empty() || rec.device_id == device_id) out.push_back(rec);
  return out;
}

Result MemoryRepository::InsertArtifactLink(Transaction& t, const model::ArtifactLinkRecord& r) {
  TX(t).Mutable().artifact_links[{r.device_id, r.artifact_name}] = r;
  return Result::Ok();
}

std::optional<model::ArtifactLinkRecord> MemoryRepository::GetArtifactLink(Transaction& t, const std::string& device_id,
                                                                           const std::string& artifact_name) {
  const auto& s  = TX(t).View();
  auto        it = s.artifact_links.find({device_id, artifact_name});
  if (it == s.artifact_links.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Retention
// ------------------------------------------------------------------

Result MemoryRepository::PruneBefore(Transaction& t, uint64_t cutoff_ms, PruneCounts& pruned) {
  auto& s = TX(t).Mutable();
  pruned  = PruneCounts{};

  auto order = s.wake_order.begin();
  while (order != s.wake_order.end()) {
    const auto& rec = s.wake_events.at(*order);
    if (fieldwake::model::IsTerminal(rec.state) && rec.hello_at_ms < cutoff_ms) {
      s.wake_events.erase(*order);
      order = s.wake_order.erase(order);
      ++pruned.wake_events;
    } else {
      ++order;
    }
  }

  for (auto it = s.transfers.begin(); it != s.transfers.end();) {
    if (it->second.status != fieldwake::model::TransferStatus::kReceiving && it->second.updated_at_ms < cutoff_ms) {
      it = s.transfers.erase(it);
      ++pruned.transfers;
    } else {
      ++it;
    }
  }

  const auto before = s.failures.size();
  s.failures.erase(std::remove_if(s.failures.begin(), s.failures.end(), [cutoff_ms](const auto& rec) { return rec.reported_at_ms < cutoff_ms; }),
                   s.failures.end());
  pruned.failures = before - s.failures.size();

  for (auto it = s.artifact_links.begin(); it != s.artifact_links.end();) {
    if (it->second.linked_at_ms < cutoff_ms) {
      it = s.artifact_links.erase(it);
      ++pruned.artifact_links;
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

} // namespace fieldwake::db::memory
