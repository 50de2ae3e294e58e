#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if FIELDWAKE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

#if FIELDWAKE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace {

using fieldwake::db::ErrorCode;
using fieldwake::db::PruneCounts;
using fieldwake::db::Repository;
using fieldwake::db::memory::MemoryRepository;
using fieldwake::db::model::ArtifactLinkRecord;
using fieldwake::db::model::DeviceRecord;
using fieldwake::db::model::FailureRecord;
using fieldwake::db::model::FragmentKey;
using fieldwake::db::model::FragmentRecord;
using fieldwake::db::model::ImageTransferRecord;
using fieldwake::db::model::WakeEventRecord;
using fieldwake::model::FailureCode;
using fieldwake::model::ProtocolState;
using fieldwake::model::TransferStatus;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

WakeEventRecord Wake(const std::string& id, const std::string& device_id, uint64_t hello_at_ms) {
  WakeEventRecord wake;
  wake.id          = id;
  wake.device_id   = device_id;
  wake.state       = ProtocolState::kHelloReceived;
  wake.hello_at_ms = hello_at_ms;
  return wake;
}

FragmentRecord Fragment(const std::string& device_id, const std::string& artifact, uint32_t index, std::string bytes, uint64_t expires_at_ms) {
  FragmentRecord fragment;
  fragment.device_id     = device_id;
  fragment.artifact_name = artifact;
  fragment.index         = index;
  fragment.bytes         = std::move(bytes);
  fragment.stored_at_ms  = 1;
  fragment.expires_at_ms = expires_at_ms;
  return fragment;
}

void VerifyWakeEvents(Repository& repo, const std::string& device_id) {
  auto tx = repo.Begin();

  assert(repo.InsertWakeEvent(*tx, Wake(device_id + "-w1", device_id, 1000)));
  assert(repo.InsertWakeEvent(*tx, Wake(device_id + "-w2", device_id, 3000)));
  assert(repo.InsertWakeEvent(*tx, Wake(device_id + "-w3", device_id, 2000)));
  assert(repo.InsertWakeEvent(*tx, Wake(device_id + "-other", device_id + "X", 9000)));
  tx->Commit();

  {
    auto dup_tx = repo.Begin();
    assert(repo.InsertWakeEvent(*dup_tx, Wake(device_id + "-w1", device_id, 1000)).code == ErrorCode::AlreadyExists);
    dup_tx->Rollback();
  }

  tx          = repo.Begin();
  auto latest = repo.LatestWakeEvent(*tx, device_id);
  assert(latest.has_value());
  assert(latest->id == device_id + "-w2");

  latest->state             = ProtocolState::kSnapSent;
  latest->artifact_name     = device_id + "_3000.jpg";
  latest->images_requested  = 1;
  latest->is_complete       = false;
  latest->next_wake_display = "8:00AM";
  assert(repo.UpdateWakeEvent(*tx, *latest));
  tx->Commit();

  auto read_tx = repo.Begin();
  auto stored  = repo.GetWakeEvent(*read_tx, device_id + "-w2");
  assert(stored.has_value());
  assert(stored->state == ProtocolState::kSnapSent);
  assert(stored->artifact_name == device_id + "_3000.jpg");
  assert(stored->images_requested == 1);
  assert(stored->next_wake_display == "8:00AM");

  const auto listed = repo.ListWakeEvents(*read_tx, device_id, 0);
  assert(listed.size() == 3);
  assert(listed[0].hello_at_ms == 3000 && listed[1].hello_at_ms == 2000 && listed[2].hello_at_ms == 1000);
  assert(repo.ListWakeEvents(*read_tx, device_id, 2).size() == 2);

  assert(!repo.GetWakeEvent(*read_tx, "missing").has_value());
  read_tx->Commit();

  auto missing_tx = repo.Begin();
  assert(repo.UpdateWakeEvent(*missing_tx, Wake("missing", device_id, 1)).code == ErrorCode::NotFound);
  missing_tx->Rollback();
}

void VerifyTransfers(Repository& repo, const std::string& device_id) {
  ImageTransferRecord transfer;
  transfer.device_id         = device_id;
  transfer.artifact_name     = "a.jpg";
  transfer.wake_event_id     = device_id + "-w1";
  transfer.total_fragments   = 5;
  transfer.received_fragments = 2;
  transfer.capture_timestamp = "2024-01-01T00:00:00Z";
  transfer.image_size        = 4096;
  transfer.created_at_ms     = 10;
  transfer.updated_at_ms     = 10;

  {
    auto tx = repo.Begin();
    assert(repo.UpsertTransfer(*tx, transfer));
    tx->Commit();
  }

  transfer.status            = TransferStatus::kFailed;
  transfer.failure_code      = FailureCode::kTransferExpired;
  transfer.retry_count       = 1;
  transfer.missing_requests  = 2;
  transfer.recovery_boundary = 4;
  transfer.last_fragment_at_ms = 20;
  {
    auto tx = repo.Begin();
    assert(repo.UpsertTransfer(*tx, transfer));
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto stored = repo.GetTransfer(*tx, device_id, "a.jpg");
  assert(stored.has_value());
  assert(stored->status == TransferStatus::kFailed);
  assert(stored->failure_code == FailureCode::kTransferExpired);
  assert(stored->retry_count == 1);
  assert(stored->missing_requests == 2);
  assert(stored->recovery_boundary == 4);
  assert(stored->image_size == 4096);
  assert(stored->capture_timestamp == "2024-01-01T00:00:00Z");
  assert(stored->last_fragment_at_ms == 20);

  // same artifact name on another device is a different transfer
  assert(!repo.GetTransfer(*tx, device_id + "X", "a.jpg").has_value());

  std::size_t mine = 0;
  for (const auto& t : repo.ListTransfers(*tx)) {
    if (t.device_id == device_id) ++mine;
  }
  assert(mine == 1);
  tx->Commit();
}

void VerifyFragments(Repository& repo, const std::string& device_id) {
  const std::string binary("\xFF\x00\xD8", 3);

  {
    auto tx = repo.Begin();
    assert(repo.InsertFragment(*tx, Fragment(device_id, "img", 2, "c", 100)));
    assert(repo.InsertFragment(*tx, Fragment(device_id, "img", 0, binary, 100)));
    assert(repo.InsertFragment(*tx, Fragment(device_id, "img", 1, "b", 100)));
    assert(repo.InsertFragment(*tx, Fragment(device_id, "old", 0, "x", 50)));
    tx->Commit();
  }

  {
    auto       tx  = repo.Begin();
    const auto dup = repo.InsertFragment(*tx, Fragment(device_id, "img", 1, "overwritten", 100));
    assert(dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert((repo.ListFragmentIndices(*tx, device_id, "img") == std::vector<uint32_t>{0, 1, 2}));
    const auto fragments = repo.ListFragments(*tx, device_id, "img");
    assert(fragments.size() == 3);
    assert(fragments[0].bytes == binary);
    assert(fragments[1].bytes == "b");
    assert(fragments[2].index == 2);

    assert(repo.TouchFragments(*tx, device_id, "img", 500));
    tx->Commit();
  }

  {
    auto                     tx = repo.Begin();
    std::vector<FragmentKey> removed;
    assert(repo.DeleteExpiredFragments(*tx, 100, removed));
    tx->Commit();

    bool saw_old = false;
    for (const auto& key : removed) {
      assert(key.artifact_name != "img" || key.device_id != device_id);
      if (key.device_id == device_id && key.artifact_name == "old") saw_old = true;
    }
    assert(saw_old);
  }

  {
    auto        tx      = repo.Begin();
    std::size_t deleted = 0;
    assert(repo.DeleteFragments(*tx, device_id, "img", deleted));
    assert(deleted == 3);
    assert(repo.ListFragmentIndices(*tx, device_id, "img").empty());
    tx->Commit();
  }
}

void VerifyDevicesAndJournals(Repository& repo, const std::string& device_id) {
  DeviceRecord device;
  device.device_id           = device_id;
  device.provisioning_status = "pending_mapping";
  device.battery_voltage     = 3.7;
  device.wifi_rssi           = -70;
  device.first_seen_at_ms    = 5;
  device.last_seen_at_ms     = 5;

  {
    auto tx = repo.Begin();
    assert(repo.UpsertDevice(*tx, device));
    device.provisioning_status = "active";
    device.next_wake_at_ms     = 99;
    assert(repo.UpsertDevice(*tx, device));

    FailureRecord failure;
    failure.id             = device_id + "-f1";
    failure.device_id      = device_id;
    failure.artifact_name  = "a.jpg";
    failure.code           = FailureCode::kUploadFailed;
    failure.message        = "bucket offline";
    failure.reported_at_ms = 7;
    assert(repo.InsertFailure(*tx, failure));

    ArtifactLinkRecord link;
    link.device_id        = device_id;
    link.artifact_name    = "a.jpg";
    link.storage_location = "/first";
    assert(repo.InsertArtifactLink(*tx, link));
    link.storage_location = "/second";
    assert(repo.InsertArtifactLink(*tx, link));
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto stored = repo.GetDevice(*tx, device_id);
  assert(stored.has_value());
  assert(stored->provisioning_status == "active");
  assert(stored->next_wake_at_ms == 99);
  assert(stored->battery_voltage == 3.7);
  assert(stored->wifi_rssi == -70);
  assert(!stored->temperature.has_value());
  assert(repo.CountDevices(*tx) >= 1);

  const auto failures = repo.ListFailures(*tx, device_id);
  assert(failures.size() == 1);
  assert(failures[0].code == FailureCode::kUploadFailed);
  assert(failures[0].message == "bucket offline");

  auto link = repo.GetArtifactLink(*tx, device_id, "a.jpg");
  assert(link.has_value());
  assert(link->storage_location == "/second");
  tx->Commit();
}

void VerifyRetention(Repository& repo, const std::string& device_id) {
  constexpr uint64_t kCutoff = 1000;

  auto old_done          = Wake(device_id + "-old-done", device_id, 100);
  old_done.state         = ProtocolState::kComplete;
  auto old_open          = Wake(device_id + "-old-open", device_id, 100);
  old_open.state         = ProtocolState::kSnapSent;
  auto recent_done       = Wake(device_id + "-recent-done", device_id, 5000);
  recent_done.state      = ProtocolState::kFailed;

  auto transfer = [&](const std::string& artifact, TransferStatus status, uint64_t updated_at_ms) {
    ImageTransferRecord rec;
    rec.device_id       = device_id;
    rec.artifact_name   = artifact;
    rec.status          = status;
    rec.total_fragments = 3;
    rec.created_at_ms   = updated_at_ms;
    rec.updated_at_ms   = updated_at_ms;
    return rec;
  };

  {
    auto tx = repo.Begin();
    assert(repo.InsertWakeEvent(*tx, old_done));
    assert(repo.InsertWakeEvent(*tx, old_open));
    assert(repo.InsertWakeEvent(*tx, recent_done));
    assert(repo.UpsertTransfer(*tx, transfer("old-done.jpg", TransferStatus::kComplete, 100)));
    assert(repo.UpsertTransfer(*tx, transfer("old-open.jpg", TransferStatus::kReceiving, 100)));
    assert(repo.UpsertTransfer(*tx, transfer("recent.jpg", TransferStatus::kFailed, 5000)));

    FailureRecord failure;
    failure.device_id      = device_id;
    failure.artifact_name  = "old-done.jpg";
    failure.code           = FailureCode::kTransferExpired;
    failure.id             = device_id + "-f-old";
    failure.reported_at_ms = 100;
    assert(repo.InsertFailure(*tx, failure));
    failure.id             = device_id + "-f-recent";
    failure.reported_at_ms = 5000;
    assert(repo.InsertFailure(*tx, failure));

    ArtifactLinkRecord link;
    link.device_id        = device_id;
    link.storage_location = "/old";
    link.artifact_name    = "old-done.jpg";
    link.linked_at_ms     = 100;
    assert(repo.InsertArtifactLink(*tx, link));
    link.artifact_name = "recent.jpg";
    link.linked_at_ms  = 5000;
    assert(repo.InsertArtifactLink(*tx, link));

    DeviceRecord device;
    device.device_id        = device_id;
    device.first_seen_at_ms = 1;
    device.last_seen_at_ms  = 1;
    assert(repo.UpsertDevice(*tx, device));
    tx->Commit();
  }

  {
    auto        tx = repo.Begin();
    std::size_t receiving = 0;
    for (const auto& t : repo.ListReceivingTransfers(*tx)) {
      assert(t.status == TransferStatus::kReceiving);
      if (t.device_id == device_id) {
        assert(t.artifact_name == "old-open.jpg");
        ++receiving;
      }
    }
    assert(receiving == 1);
    tx->Commit();
  }

  // pruning is table-wide, so rows left by earlier suites may be counted too
  PruneCounts pruned;
  {
    auto tx = repo.Begin();
    assert(repo.PruneBefore(*tx, kCutoff, pruned));
    tx->Commit();
  }
  assert(pruned.wake_events >= 1);
  assert(pruned.transfers >= 1);
  assert(pruned.failures >= 1);
  assert(pruned.artifact_links >= 1);
  assert(pruned.Total() >= 4);

  auto tx = repo.Begin();
  assert(!repo.GetWakeEvent(*tx, old_done.id).has_value());
  assert(repo.GetWakeEvent(*tx, old_open.id).has_value());
  assert(repo.GetWakeEvent(*tx, recent_done.id).has_value());

  assert(!repo.GetTransfer(*tx, device_id, "old-done.jpg").has_value());
  assert(repo.GetTransfer(*tx, device_id, "old-open.jpg").has_value());
  assert(repo.GetTransfer(*tx, device_id, "recent.jpg").has_value());

  const auto failures = repo.ListFailures(*tx, device_id);
  assert(failures.size() == 1);
  assert(failures[0].id == device_id + "-f-recent");

  assert(!repo.GetArtifactLink(*tx, device_id, "old-done.jpg").has_value());
  assert(repo.GetArtifactLink(*tx, device_id, "recent.jpg").has_value());

  assert(repo.GetDevice(*tx, device_id).has_value());
  tx->Commit();

  // a second pass has nothing left to do for this device
  PruneCounts again;
  auto        again_tx = repo.Begin();
  assert(repo.PruneBefore(*again_tx, kCutoff, again));
  again_tx->Commit();
  assert(again.wake_events == 0 && again.transfers == 0 && again.failures == 0 && again.artifact_links == 0);
}

void VerifyRollbackBehavior(Repository& repo, const std::string& device_id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertWakeEvent(*tx, Wake(device_id + "-rolled-back", device_id, 1)));
    tx->Rollback();
  }
  {
    // destructor without commit rolls back as well
    auto tx = repo.Begin();
    assert(repo.InsertFragment(*tx, Fragment(device_id, "dropped", 0, "x", 1)));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetWakeEvent(*check_tx, device_id + "-rolled-back").has_value());
  assert(repo.ListFragmentIndices(*check_tx, device_id, "dropped").empty());
  check_tx->Commit();
}

void VerifyWritersAreSerialized(Repository& repo, const std::string& device_id) {
  std::atomic<bool> second_started{false};
  std::atomic<bool> first_committed{false};
  bool              second_saw_commit = false;

  auto tx1 = repo.Begin();
  assert(repo.InsertFragment(*tx1, Fragment(device_id, "race", 0, "a", 1000)));

  std::thread second([&] {
    second_started = true;
    auto       tx2 = repo.Begin();
    const auto dup = repo.InsertFragment(*tx2, Fragment(device_id, "race", 0, "b", 1000));
    second_saw_commit = first_committed.load();
    assert(dup.code == ErrorCode::AlreadyExists);
    tx2->Rollback();
  });

  while (!second_started) std::this_thread::yield();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  first_committed = true;
  tx1->Commit();
  second.join();

  assert(second_saw_commit);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& device_id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertWakeEvent(*tx, Wake(device_id + "-durable", device_id, 42)));
    assert(repo->InsertFragment(*tx, Fragment(device_id, "durable.jpg", 0, "persisted", 1000)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetWakeEvent(*tx, device_id + "-durable").has_value());
  const auto fragments = repo->ListFragments(*tx, device_id, "durable.jpg");
  assert(fragments.size() == 1);
  assert(fragments[0].bytes == "persisted");

  // deduplication survives the restart
  assert(repo->InsertFragment(*tx, Fragment(device_id, "durable.jpg", 0, "again", 1000)).code == ErrorCode::AlreadyExists);
  tx->Rollback();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if FIELDWAKE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("fieldwake_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<fieldwake::db::sqlite::SqliteDB>(db_path);
    fieldwake::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<fieldwake::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if FIELDWAKE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("FIELDWAKE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("FIELDWAKE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<fieldwake::db::postgres::PgPool>(conninfo);
    fieldwake::db::postgres::BootstrapSchema(*pool);
    return std::make_shared<fieldwake::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // unique per run so a persistent postgres database can be reused
  const auto tag = backend.name + std::to_string(NowMs());

  VerifyWakeEvents(*repo, tag + "-wakes");
  VerifyTransfers(*repo, tag + "-transfers");
  VerifyFragments(*repo, tag + "-fragments");
  VerifyDevicesAndJournals(*repo, tag + "-devices");
  VerifyRetention(*repo, tag + "-retention");
  VerifyRollbackBehavior(*repo, tag + "-rollback");
  VerifyWritersAreSerialized(*repo, tag + "-race");

  repo.reset();
  VerifyRestartDurability(backend, tag + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if FIELDWAKE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if FIELDWAKE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "fieldwake_integration_repository_parity: pass\n";
  return 0;
}
