#pragma once

#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace fieldwake::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertWakeEvent(Transaction&, const model::WakeEventRecord&) override;
  Result UpdateWakeEvent(Transaction&, const model::WakeEventRecord&) override;
  std::optional<model::WakeEventRecord> GetWakeEvent(Transaction&, const std::string&) override;
  std::optional<model::WakeEventRecord> LatestWakeEvent(Transaction&, const std::string&) override;
  std::vector<model::WakeEventRecord> ListWakeEvents(Transaction&, const std::string&, std::size_t) override;

  Result UpsertTransfer(Transaction&, const model::ImageTransferRecord&) override;
  std::optional<model::ImageTransferRecord> GetTransfer(Transaction&, const std::string&, const std::string&) override;
  std::vector<model::ImageTransferRecord> ListTransfers(Transaction&) override;
  std::vector<model::ImageTransferRecord> ListReceivingTransfers(Transaction&) override;

  Result InsertFragment(Transaction&, const model::FragmentRecord&) override;
  std::vector<uint32_t> ListFragmentIndices(Transaction&, const std::string&, const std::string&) override;
  std::vector<model::FragmentRecord> ListFragments(Transaction&, const std::string&, const std::string&) override;
  Result TouchFragments(Transaction&, const std::string&, const std::string&, uint64_t) override;
  Result DeleteFragments(Transaction&, const std::string&, const std::string&, std::size_t&) override;
  Result DeleteExpiredFragments(Transaction&, uint64_t, std::vector<model::FragmentKey>&) override;
  uint64_t CountFragments(Transaction&) override;

  Result UpsertDevice(Transaction&, const model::DeviceRecord&) override;
  std::optional<model::DeviceRecord> GetDevice(Transaction&, const std::string&) override;
  uint64_t CountDevices(Transaction&) override;

  Result InsertFailure(Transaction&, const model::FailureRecord&) override;
  std::vector<model::FailureRecord> ListFailures(Transaction&, const std::string&) override;
  Result InsertArtifactLink(Transaction&, const model::ArtifactLinkRecord&) override;
  std::optional<model::ArtifactLinkRecord> GetArtifactLink(Transaction&, const std::string&, const std::string&) override;

  Result PruneBefore(Transaction&, uint64_t, PruneCounts&) override;

private:
  friend class MemoryTransaction;

  using ArtifactKey = std::pair<std::string, std::string>;
  using FragmentIndexKey = std::tuple<std::string, std::string, uint32_t>;

  struct State {
    std::unordered_map<std::string, model::WakeEventRecord> wake_events;
    // insertion order, breaks ties between equal hello times
    std::vector<std::string> wake_order;

    std::map<ArtifactKey, model::ImageTransferRecord> transfers;
    std::map<FragmentIndexKey, model::FragmentRecord> fragments;
    std::unordered_map<std::string, model::DeviceRecord> devices;

    std::vector<model::FailureRecord> failures;
    std::map<ArtifactKey, model::ArtifactLinkRecord> artifact_links;
  };

  // held by the open transaction for its whole lifetime
  std::mutex mutex_;
  State committed_;
};

} // namespace fieldwake::db::memory
