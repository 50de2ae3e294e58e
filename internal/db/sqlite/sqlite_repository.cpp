#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace fieldwake::db::sqlite {

using fieldwake::db::ErrorCode;
using fieldwake::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)>;

StmtPtr Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    st = nullptr;
  }
  return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

template <typename T>
void BindOptional(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
  if (!v) {
    sqlite3_bind_null(st, idx);
  } else if constexpr (std::is_floating_point_v<T>) {
    sqlite3_bind_double(st, idx, *v);
  } else {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*v));
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string{};
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_double(st, col);
}

std::optional<int32_t> ColOptI32(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_int(st, col);
}

constexpr const char* kWakeColumns =
    "id,device_id,artifact_name,state,hello_at_ms,ack_at_ms,capture_requested_at_ms,metadata_at_ms,sleep_sent_at_ms,"
    "is_complete,images_requested,images_completed,pending_count,next_wake_at_ms,next_wake_display,failure_reason";

model::WakeEventRecord ReadWake(sqlite3_stmt* st) {
  model::WakeEventRecord r;
  r.id                      = ColText(st, 0);
  r.device_id               = ColText(st, 1);
  r.artifact_name           = ColText(st, 2);
  r.state                   = fieldwake::model::ProtocolStateFromInt(ColI32(st, 3));
  r.hello_at_ms             = ColU64(st, 4);
  r.ack_at_ms               = ColU64(st, 5);
  r.capture_requested_at_ms = ColU64(st, 6);
  r.metadata_at_ms          = ColU64(st, 7);
  r.sleep_sent_at_ms        = ColU64(st, 8);
  r.is_complete             = ColI32(st, 9) != 0;
  r.images_requested        = static_cast<uint32_t>(ColU64(st, 10));
  r.images_completed        = static_cast<uint32_t>(ColU64(st, 11));
  r.pending_count           = static_cast<uint32_t>(ColU64(st, 12));
  r.next_wake_at_ms         = ColU64(st, 13);
  r.next_wake_display       = ColText(st, 14);
  r.failure_reason          = ColText(st, 15);
  return r;
}

// Binds every column except id, starting at parameter 1.
void BindWakeBody(sqlite3_stmt* st, const model::WakeEventRecord& r) {
  BindText(st, 1, r.device_id);
  BindText(st, 2, r.artifact_name);
  BindI32(st, 3, static_cast<int>(r.state));
  BindU64(st, 4, r.hello_at_ms);
  BindU64(st, 5, r.ack_at_ms);
  BindU64(st, 6, r.capture_requested_at_ms);
  BindU64(st, 7, r.metadata_at_ms);
  BindU64(st, 8, r.sleep_sent_at_ms);
  BindI32(st, 9, r.is_complete ? 1 : 0);
  BindU64(st, 10, r.images_requested);
  BindU64(st, 11, r.images_completed);
  BindU64(st, 12, r.pending_count);
  BindU64(st, 13, r.next_wake_at_ms);
  BindText(st, 14, r.next_wake_display);
  BindText(st, 15, r.failure_reason);
}

constexpr const char* kTransferColumns =
    "device_id,artifact_name,wake_event_id,total_fragments,received_fragments,status,failure_code,storage_location,"
    "retry_count,missing_requests,recovery_boundary,capture_timestamp,image_size,max_chunk_size,created_at_ms,"
    "updated_at_ms,last_fragment_at_ms";

model::ImageTransferRecord ReadTransfer(sqlite3_stmt* st) {
  model::ImageTransferRecord r;
  r.device_id           = ColText(st, 0);
  r.artifact_name       = ColText(st, 1);
  r.wake_event_id       = ColText(st, 2);
  r.total_fragments     = static_cast<uint32_t>(ColU64(st, 3));
  r.received_fragments  = static_cast<uint32_t>(ColU64(st, 4));
  r.status              = fieldwake::model::TransferStatusFromInt(ColI32(st, 5));
  r.failure_code        = fieldwake::model::FailureCodeFromInt(ColI32(st, 6));
  r.storage_location    = ColText(st, 7);
  r.retry_count         = static_cast<uint32_t>(ColU64(st, 8));
  r.missing_requests    = static_cast<uint32_t>(ColU64(st, 9));
  r.recovery_boundary   = static_cast<uint32_t>(ColU64(st, 10));
  r.capture_timestamp   = ColText(st, 11);
  r.image_size          = ColU64(st, 12);
  r.max_chunk_size      = static_cast<uint32_t>(ColU64(st, 13));
  r.created_at_ms       = ColU64(st, 14);
  r.updated_at_ms       = ColU64(st, 15);
  r.last_fragment_at_ms = ColU64(st, 16);
  return r;
}

constexpr const char* kDeviceColumns =
    "device_id,provisioning_status,firmware_version,hardware_version,wifi_rssi,battery_voltage,battery_health_percent,"
    "temperature,humidity,pressure,gas_resistance,pending_count,first_seen_at_ms,last_seen_at_ms,last_wake_at_ms,"
    "next_wake_at_ms,wake_schedule";

model::DeviceRecord ReadDevice(sqlite3_stmt* st) {
  model::DeviceRecord r;
  r.device_id              = ColText(st, 0);
  r.provisioning_status    = ColText(st, 1);
  r.firmware_version       = ColText(st, 2);
  r.hardware_version       = ColText(st, 3);
  r.wifi_rssi              = ColOptI32(st, 4);
  r.battery_voltage        = ColOptDouble(st, 5);
  r.battery_health_percent = ColOptDouble(st, 6);
  r.temperature            = ColOptDouble(st, 7);
  r.humidity               = ColOptDouble(st, 8);
  r.pressure               = ColOptDouble(st, 9);
  r.gas_resistance         = ColOptDouble(st, 10);
  r.pending_count          = static_cast<uint32_t>(ColU64(st, 11));
  r.first_seen_at_ms       = ColU64(st, 12);
  r.last_seen_at_ms        = ColU64(st, 13);
  r.last_wake_at_ms        = ColU64(st, 14);
  r.next_wake_at_ms        = ColU64(st, 15);
  r.wake_schedule          = ColText(st, 16);
  return r;
}

uint64_t CountRows(sqlite3* db, const char* sql) {
  auto st = Prepare(db, sql);
  if (!st || sqlite3_step(st.get()) != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Wake events
// ------------------------------------------------------------------

Result SqliteRepository::InsertWakeEvent(Transaction& t, const model::WakeEventRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO wake_event(device_id,artifact_name,state,hello_at_ms,ack_at_ms,capture_requested_at_ms,"
                    "metadata_at_ms,sleep_sent_at_ms,is_complete,images_requested,images_completed,pending_count,"
                    "next_wake_at_ms,next_wake_display,failure_reason,id) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindWakeBody(st.get(), r);
  BindText(st.get(), 16, r.id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "wake event " + r.id);
  return Translate(db, rc);
}

Result SqliteRepository::UpdateWakeEvent(Transaction& t, const model::WakeEventRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "UPDATE wake_event SET device_id=?,artifact_name=?,state=?,hello_at_ms=?,ack_at_ms=?,"
                    "capture_requested_at_ms=?,metadata_at_ms=?,sleep_sent_at_ms=?,is_complete=?,images_requested=?,"
                    "images_completed=?,pending_count=?,next_wake_at_ms=?,next_wake_display=?,failure_reason=? WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindWakeBody(st.get(), r);
  BindText(st.get(), 16, r.id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "wake event " + r.id);
  return Translate(db, rc);
}

std::optional<model::WakeEventRecord> SqliteRepository::GetWakeEvent(Transaction& t, const std::string& id) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kWakeColumns + " FROM wake_event WHERE id=?;";

  auto st = Prepare(db, sql.c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadWake(st.get());
}

std::optional<model::WakeEventRecord> SqliteRepository::LatestWakeEvent(Transaction& t, const std::string& device_id) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kWakeColumns +
                          " FROM wake_event WHERE device_id=? ORDER BY hello_at_ms DESC, rowid DESC LIMIT 1;";

  auto st = Prepare(db, sql.c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, device_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadWake(st.get());
}

std::vector<model::WakeEventRecord> SqliteRepository::ListWakeEvents(Transaction& t, const std::string& device_id, std::size_t limit) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kWakeColumns + " FROM wake_event";
  if (!device_id.empty()) sql += " WHERE device_id=?";
  sql += " ORDER BY hello_at_ms DESC, rowid DESC";
  if (limit != 0) sql += " LIMIT " + std::to_string(limit);
  sql += ";";

  std::vector<model::WakeEventRecord> out;
  auto                                st = Prepare(db, sql.c_str());
  if (!st) return out;

  if (!device_id.empty()) BindText(st.get(), 1, device_id);
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadWake(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Transfers
// ------------------------------------------------------------------

Result SqliteRepository::UpsertTransfer(Transaction& t, const model::ImageTransferRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO image_transfer(device_id,artifact_name,wake_event_id,total_fragments,received_fragments,"
                    "status,failure_code,storage_location,retry_count,missing_requests,recovery_boundary,"
                    "capture_timestamp,image_size,max_chunk_size,created_at_ms,updated_at_ms,last_fragment_at_ms) "
                    "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
                    "ON CONFLICT(device_id,artifact_name) DO UPDATE SET wake_event_id=excluded.wake_event_id,"
                    "total_fragments=excluded.total_fragments,received_fragments=excluded.received_fragments,"
                    "status=excluded.status,failure_code=excluded.failure_code,storage_location=excluded.storage_location,"
                    "retry_count=excluded.retry_count,missing_requests=excluded.missing_requests,"
                    "recovery_boundary=excluded.recovery_boundary,capture_timestamp=excluded.capture_timestamp,"
                    "image_size=excluded.image_size,max_chunk_size=excluded.max_chunk_size,"
                    "updated_at_ms=excluded.updated_at_ms,last_fragment_at_ms=excluded.last_fragment_at_ms;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.device_id);
  BindText(st.get(), 2, r.artifact_name);
  BindText(st.get(), 3, r.wake_event_id);
  BindU64(st.get(), 4, r.total_fragments);
  BindU64(st.get(), 5, r.received_fragments);
  BindI32(st.get(), 6, static_cast<int>(r.status));
  BindI32(st.get(), 7, static_cast<int>(r.failure_code));
  BindText(st.get(), 8, r.storage_location);
  BindU64(st.get(), 9, r.retry_count);
  BindU64(st.get(), 10, r.missing_requests);
  BindU64(st.get(), 11, r.recovery_boundary);
  BindText(st.get(), 12, r.capture_timestamp);
  BindU64(st.get(), 13, r.image_size);
  BindU64(st.get(), 14, r.max_chunk_size);
  BindU64(st.get(), 15, r.created_at_ms);
  BindU64(st.get(), 16, r.updated_at_ms);
  BindU64(st.get(), 17, r.last_fragment_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ImageTransferRecord> SqliteRepository::GetTransfer(Transaction& t, const std::string& device_id,
                                                                        const std::string& artifact_name) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kTransferColumns + " FROM image_transfer WHERE device_id=? AND artifact_name=?;";

  auto st = Prepare(db, sql.c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, device_id);
  BindText(st.get(), 2, artifact_name);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadTransfer(st.get());
}

std::vector<model::ImageTransferRecord> SqliteRepository::ListTransfers(Transaction& t) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kTransferColumns + " FROM image_transfer ORDER BY device_id, artifact_name;";

  std::vector<model::ImageTransferRecord> out;
  auto                                    st = Prepare(db, sql.c_str());
  if (!st) return out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadTransfer(st.get()));
  return out;
}

std::vector<model::ImageTransferRecord> SqliteRepository::ListReceivingTransfers(Transaction& t) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kTransferColumns + " FROM image_transfer WHERE status=? ORDER BY device_id, artifact_name;";

  std::vector<model::ImageTransferRecord> out;
  auto                                    st = Prepare(db, sql.c_str());
  if (!st) return out;
  BindI32(st.get(), 1, static_cast<int>(fieldwake::model::TransferStatus::kReceiving));
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadTransfer(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Fragments
// ------------------------------------------------------------------

Result SqliteRepository::InsertFragment(Transaction& t, const model::FragmentRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT OR IGNORE INTO fragment(device_id,artifact_name,idx,bytes,stored_at_ms,expires_at_ms) "
                    "VALUES(?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.device_id);
  BindText(st.get(), 2, r.artifact_name);
  BindU64(st.get(), 3, r.index);
  BindBlob(st.get(), 4, r.bytes);
  BindU64(st.get(), 5, r.stored_at_ms);
  BindU64(st.get(), 6, r.expires_at_ms);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists);
  return Translate(db, rc);
}

std::vector<uint32_t> SqliteRepository::ListFragmentIndices(Transaction& t, const std::string& device_id,
                                                            const std::string& artifact_name) {
  auto*                 db = TX(t).Handle();
  std::vector<uint32_t> out;

  auto st = Prepare(db, "SELECT idx FROM fragment WHERE device_id=? AND artifact_name=? ORDER BY idx;");
  if (!st) return out;

  BindText(st.get(), 1, device_id);
  BindText(st.get(), 2, artifact_name);
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(static_cast<uint32_t>(ColU64(st.get(), 0)));
  return out;
}

std::vector<model::FragmentRecord> SqliteRepository::ListFragments(Transaction& t, const std::string& device_id,
                                                                   const std::string& artifact_name) {
  auto*                              db = TX(t).Handle();
  std::vector<model::FragmentRecord> out;

  auto st = Prepare(db,
                    "SELECT idx,bytes,stored_at_ms,expires_at_ms FROM fragment WHERE device_id=? AND artifact_name=? "
                    "ORDER BY idx;");
  if (!st) return out;

  BindText(st.get(), 1, device_id);
  BindText(st.get(), 2, artifact_name);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::FragmentRecord r;
    r.device_id     = device_id;
    r.artifact_name = artifact_name;
    r.index         = static_cast<uint32_t>(ColU64(st.get(), 0));
    r.bytes         = ColBlob(st.get(), 1);
    r.stored_at_ms  = ColU64(st.get(), 2);
    r.expires_at_ms = ColU64(st.get(), 3);
    out.push_back(std::move(r));
  }
  return out;
}

Result SqliteRepository::TouchFragments(Transaction& t, const std::string& device_id, const std::string& artifact_name,
                                        uint64_t expires_at_ms) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "UPDATE fragment SET expires_at_ms=? WHERE device_id=? AND artifact_name=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, expires_at_ms);
  BindText(st.get(), 2, device_id);
  BindText(st.get(), 3, artifact_name);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteFragments(Transaction& t, const std::string& device_id, const std::string& artifact_name,
                                         std::size_t& deleted) {
  auto* db = TX(t).Handle();
  deleted  = 0;

  auto st = Prepare(db, "DELETE FROM fragment WHERE device_id=? AND artifact_name=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, device_id);
  BindText(st.get(), 2, artifact_name);
  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) deleted = static_cast<std::size_t>(sqlite3_changes(db));
  return Translate(db, rc);
}

Result SqliteRepository::DeleteExpiredFragments(Transaction& t, uint64_t now_ms, std::vector<model::FragmentKey>& removed) {
  auto* db = TX(t).Handle();
  removed.clear();

  auto select = Prepare(db,
                        "SELECT DISTINCT device_id,artifact_name FROM fragment WHERE expires_at_ms<=? "
                        "ORDER BY device_id, artifact_name;");
  if (!select) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(select.get(), 1, now_ms);
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(select.get())) == SQLITE_ROW) {
    removed.push_back({ColText(select.get(), 0), ColText(select.get(), 1)});
  }
  if (rc != SQLITE_DONE) return Translate(db, rc);

  auto del = Prepare(db, "DELETE FROM fragment WHERE expires_at_ms<=?;");
  if (!del) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(del.get(), 1, now_ms);
  return Translate(db, sqlite3_step(del.get()));
}

uint64_t SqliteRepository::CountFragments(Transaction& t) {
  return CountRows(TX(t).Handle(), "SELECT COUNT(*) FROM fragment;");
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result SqliteRepository::UpsertDevice(Transaction& t, const model::DeviceRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO device(device_id,provisioning_status,firmware_version,hardware_version,wifi_rssi,"
                    "battery_voltage,battery_health_percent,temperature,humidity,pressure,gas_resistance,pending_count,"
                    "first_seen_at_ms,last_seen_at_ms,last_wake_at_ms,next_wake_at_ms,wake_schedule) "
                    "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
                    "ON CONFLICT(device_id) DO UPDATE SET provisioning_status=excluded.provisioning_status,"
                    "firmware_version=excluded.firmware_version,hardware_version=excluded.hardware_version,"
                    "wifi_rssi=excluded.wifi_rssi,battery_voltage=excluded.battery_voltage,"
                    "battery_health_percent=excluded.battery_health_percent,temperature=excluded.temperature,"
                    "humidity=excluded.humidity,pressure=excluded.pressure,gas_resistance=excluded.gas_resistance,"
                    "pending_count=excluded.pending_count,last_seen_at_ms=excluded.last_seen_at_ms,"
                    "last_wake_at_ms=excluded.last_wake_at_ms,next_wake_at_ms=excluded.next_wake_at_ms,"
                    "wake_schedule=excluded.wake_schedule;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.device_id);
  BindText(st.get(), 2, r.provisioning_status);
  BindText(st.get(), 3, r.firmware_version);
  BindText(st.get(), 4, r.hardware_version);
  BindOptional(st.get(), 5, r.wifi_rssi);
  BindOptional(st.get(), 6, r.battery_voltage);
  BindOptional(st.get(), 7, r.battery_health_percent);
  BindOptional(st.get(), 8, r.temperature);
  BindOptional(st.get(), 9, r.humidity);
  BindOptional(st.get(), 10, r.pressure);
  BindOptional(st.get(), 11, r.gas_resistance);
  BindU64(st.get(), 12, r.pending_count);
  BindU64(st.get(), 13, r.first_seen_at_ms);
  BindU64(st.get(), 14, r.last_seen_at_ms);
  BindU64(st.get(), 15, r.last_wake_at_ms);
  BindU64(st.get(), 16, r.next_wake_at_ms);
  BindText(st.get(), 17, r.wake_schedule);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::DeviceRecord> SqliteRepository::GetDevice(Transaction& t, const std::string& device_id) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kDeviceColumns + " FROM device WHERE device_id=?;";

  auto st = Prepare(db, sql.c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, device_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadDevice(st.get());
}

uint64_t SqliteRepository::CountDevices(Transaction& t) {
  return CountRows(TX(t).Handle(), "SELECT COUNT(*) FROM device;");
}

// ------------------------------------------------------------------
// Journals
// ------------------------------------------------------------------

Result SqliteRepository::InsertFailure(Transaction& t, const model::FailureRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT INTO failure_journal(id,device_id,artifact_name,wake_event_id,code,message,reported_at_ms) "
                    "VALUES(?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.device_id);
  BindText(st.get(), 3, r.artifact_name);
  BindText(st.get(), 4, r.wake_event_id);
  BindI32(st.get(), 5, static_cast<int>(r.code));
  BindText(st.get(), 6, r.message);
  BindU64(st.get(), 7, r.reported_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::FailureRecord> SqliteRepository::ListFailures(Transaction& t, const std::string& device_id) {
  auto*       db  = TX(t).Handle();
  std::string sql = "SELECT id,device_id,artifact_name,wake_event_id,code,message,reported_at_ms FROM failure_journal";
  if (!device_id.empty()) sql += " WHERE device_id=?";
  sql += " ORDER BY reported_at_ms, rowid;";

  std::vector<model::FailureRecord> out;
  auto                              st = Prepare(db, sql.c_str());
  if (!st) return out;

  if (!device_id.empty()) BindText(st.get(), 1, device_id);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::FailureRecord r;
    r.id             = ColText(st.get(), 0);
    r.device_id      = ColText(st.get(), 1);
    r.artifact_name  = ColText(st.get(), 2);
    r.wake_event_id  = ColText(st.get(), 3);
    r.code           = fieldwake::model::FailureCodeFromInt(ColI32(st.get(), 4));
    r.message        = ColText(st.get(), 5);
    r.reported_at_ms = ColU64(st.get(), 6);
    out.push_back(std::move(r));
  }
  return out;
}

Result SqliteRepository::InsertArtifactLink(Transaction& t, const model::ArtifactLinkRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "INSERT OR REPLACE INTO artifact_link(device_id,artifact_name,wake_event_id,storage_location,site_id,"
                    "program_id,company_id,size_bytes,linked_at_ms) VALUES(?,?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.device_id);
  BindText(st.get(), 2, r.artifact_name);
  BindText(st.get(), 3, r.wake_event_id);
  BindText(st.get(), 4, r.storage_location);
  BindText(st.get(), 5, r.site_id);
  BindText(st.get(), 6, r.program_id);
  BindText(st.get(), 7, r.company_id);
  BindU64(st.get(), 8, r.size_bytes);
  BindU64(st.get(), 9, r.linked_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ArtifactLinkRecord> SqliteRepository::GetArtifactLink(Transaction& t, const std::string& device_id,
                                                                           const std::string& artifact_name) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "SELECT wake_event_id,storage_location,site_id,program_id,company_id,size_bytes,linked_at_ms "
                    "FROM artifact_link WHERE device_id=? AND artifact_name=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, device_id);
  BindText(st.get(), 2, artifact_name);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::ArtifactLinkRecord r;
  r.device_id        = device_id;
  r.artifact_name    = artifact_name;
  r.wake_event_id    = ColText(st.get(), 0);
  r.storage_location = ColText(st.get(), 1);
  r.site_id          = ColText(st.get(), 2);
  r.program_id       = ColText(st.get(), 3);
  r.company_id       = ColText(st.get(), 4);
  r.size_bytes       = ColU64(st.get(), 5);
  r.linked_at_ms     = ColU64(st.get(), 6);
  return r;
}

// ------------------------------------------------------------------
// Retention
// ------------------------------------------------------------------

Result SqliteRepository::PruneBefore(Transaction& t, uint64_t cutoff_ms, PruneCounts& pruned) {
  auto* db = TX(t).Handle();
  pruned   = PruneCounts{};

  // parameter 1 is always the cutoff; extra binds start at 2
  auto run = [db, cutoff_ms](const char* sql, auto&& bind_extra, uint64_t& count) -> Result {
    auto st = Prepare(db, sql);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, cutoff_ms);
    bind_extra(st.get());
    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    count = static_cast<uint64_t>(sqlite3_changes(db));
    return Result::Ok();
  };
  auto no_extra = [](sqlite3_stmt*) {};

  auto r = run("DELETE FROM wake_event WHERE hello_at_ms<? AND state IN (?,?,?);",
               [](sqlite3_stmt* st) {
                 BindI32(st, 2, static_cast<int>(fieldwake::model::ProtocolState::kComplete));
                 BindI32(st, 3, static_cast<int>(fieldwake::model::ProtocolState::kSleepOnly));
                 BindI32(st, 4, static_cast<int>(fieldwake::model::ProtocolState::kFailed));
               },
               pruned.wake_events);
  if (!r) return r;

  r = run("DELETE FROM image_transfer WHERE updated_at_ms<? AND status<>?;",
          [](sqlite3_stmt* st) { BindI32(st, 2, static_cast<int>(fieldwake::model::TransferStatus::kReceiving)); }, pruned.transfers);
  if (!r) return r;

  r = run("DELETE FROM failure_journal WHERE reported_at_ms<?;", no_extra, pruned.failures);
  if (!r) return r;

  return run("DELETE FROM artifact_link WHERE linked_at_ms<?;", no_extra, pruned.artifact_links);
}

} // namespace fieldwake::db::sqlite
