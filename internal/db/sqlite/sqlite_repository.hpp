#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace fieldwake::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
