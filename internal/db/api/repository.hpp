#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/artifact_link_record.hpp"
#include "internal/db/model/device_record.hpp"
#include "internal/db/model/failure_record.hpp"
#include "internal/db/model/fragment_record.hpp"
#include "internal/db/model/image_transfer_record.hpp"
#include "internal/db/model/wake_event_record.hpp"

namespace fieldwake::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Fragment rows are unique per (device, artifact, index); a second insert
    of the same key reports AlreadyExists and leaves the stored bytes alone
  - Every key that addresses engine state includes the device id

  The DB is the source of truth for:
    wake events
    image transfers and their fragments
    device schedule state

  Finished rows are kept for a retention window and then removed with
  PruneBefore. Devices are never pruned.
*/

struct PruneCounts {
  uint64_t wake_events    = 0;
  uint64_t transfers      = 0;
  uint64_t failures       = 0;
  uint64_t artifact_links = 0;

  uint64_t Total() const { return wake_events + transfers + failures + artifact_links; }
};

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Wake events
  // ---------------------------------------------------------------------

  virtual Result InsertWakeEvent(Transaction&, const model::WakeEventRecord&) = 0;

  virtual Result UpdateWakeEvent(Transaction&, const model::WakeEventRecord&) = 0;

  virtual std::optional<model::WakeEventRecord> GetWakeEvent(Transaction&, const std::string& id) = 0;

  // Most recent wake (by hello time) for the device.
  virtual std::optional<model::WakeEventRecord> LatestWakeEvent(Transaction&, const std::string& device_id) = 0;

  // Newest first. Empty device_id lists all devices; limit 0 means unlimited.
  virtual std::vector<model::WakeEventRecord> ListWakeEvents(Transaction&, const std::string& device_id, std::size_t limit) = 0;

  // ---------------------------------------------------------------------
  // Image transfers
  // ---------------------------------------------------------------------

  virtual Result UpsertTransfer(Transaction&, const model::ImageTransferRecord&) = 0;

  virtual std::optional<model::ImageTransferRecord> GetTransfer(Transaction&, const std::string& device_id, const std::string& artifact_name) = 0;

  virtual std::vector<model::ImageTransferRecord> ListTransfers(Transaction&) = 0;

  // Only transfers still in the receiving state, ordered by (device, artifact).
  virtual std::vector<model::ImageTransferRecord> ListReceivingTransfers(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Fragments
  // ---------------------------------------------------------------------

  // Write-if-absent. AlreadyExists when the key is already stored.
  virtual Result InsertFragment(Transaction&, const model::FragmentRecord&) = 0;

  // Ascending.
  virtual std::vector<uint32_t> ListFragmentIndices(Transaction&, const std::string& device_id, const std::string& artifact_name) = 0;

  // Ordered by index.
  virtual std::vector<model::FragmentRecord> ListFragments(Transaction&, const std::string& device_id, const std::string& artifact_name) = 0;

  virtual Result TouchFragments(Transaction&, const std::string& device_id, const std::string& artifact_name, uint64_t expires_at_ms) = 0;

  virtual Result DeleteFragments(Transaction&, const std::string& device_id, const std::string& artifact_name, std::size_t& deleted) = 0;

  // Removes rows with expires_at_ms <= now_ms and reports each distinct key touched.
  virtual Result DeleteExpiredFragments(Transaction&, uint64_t now_ms, std::vector<model::FragmentKey>& removed) = 0;

  virtual uint64_t CountFragments(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Devices
  // ---------------------------------------------------------------------

  virtual Result UpsertDevice(Transaction&, const model::DeviceRecord&) = 0;

  virtual std::optional<model::DeviceRecord> GetDevice(Transaction&, const std::string& device_id) = 0;

  virtual uint64_t CountDevices(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Notification journals
  // ---------------------------------------------------------------------

  virtual Result InsertFailure(Transaction&, const model::FailureRecord&) = 0;

  virtual std::vector<model::FailureRecord> ListFailures(Transaction&, const std::string& device_id) = 0;

  virtual Result InsertArtifactLink(Transaction&, const model::ArtifactLinkRecord&) = 0;

  virtual std::optional<model::ArtifactLinkRecord> GetArtifactLink(Transaction&, const std::string& device_id, const std::string& artifact_name) = 0;

  // ---------------------------------------------------------------------
  // Retention
  // ---------------------------------------------------------------------

  // Deletes rows older than cutoff_ms: terminal wake events (by hello time),
  // complete or failed transfers (by last update), failure journal entries
  // and artifact links. Wake events and transfers still in flight are kept.
  virtual Result PruneBefore(Transaction&, uint64_t cutoff_ms, PruneCounts& pruned) = 0;
};

} // namespace fieldwake::db
