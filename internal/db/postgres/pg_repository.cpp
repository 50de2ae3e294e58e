#include "pg_repository.hpp"

#include <cstddef>
#include <string>

namespace fieldwake::db::postgres {

namespace {

using Bytes = std::basic_string<std::byte>;

Bytes ToBytes(const std::string& s) {
  Bytes out(s.size(), std::byte{0});
  for (std::size_t i = 0; i < s.size(); ++i) out[i] = static_cast<std::byte>(static_cast<unsigned char>(s[i]));
  return out;
}

std::string FromBytes(const Bytes& b) {
  std::string out(b.size(), '\0');
  for (std::size_t i = 0; i < b.size(); ++i) out[i] = static_cast<char>(b[i]);
  return out;
}

template <typename T>
std::optional<T> OptField(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<T>();
}

constexpr const char* kWakeColumns =
    "id,device_id,artifact_name,state,hello_at_ms,ack_at_ms,capture_requested_at_ms,metadata_at_ms,sleep_sent_at_ms,"
    "is_complete,images_requested,images_completed,pending_count,next_wake_at_ms,next_wake_display,failure_reason";

model::WakeEventRecord ReadWake(const pqxx::row& row) {
  model::WakeEventRecord r;
  r.id                      = row[0].c_str();
  r.device_id               = row[1].c_str();
  r.artifact_name           = row[2].c_str();
  r.state                   = fieldwake::model::ProtocolStateFromInt(row[3].as<int>());
  r.hello_at_ms             = row[4].as<uint64_t>();
  r.ack_at_ms               = row[5].as<uint64_t>();
  r.capture_requested_at_ms = row[6].as<uint64_t>();
  r.metadata_at_ms          = row[7].as<uint64_t>();
  r.sleep_sent_at_ms        = row[8].as<uint64_t>();
  r.is_complete             = row[9].as<bool>();
  r.images_requested        = row[10].as<uint32_t>();
  r.images_completed        = row[11].as<uint32_t>();
  r.pending_count           = row[12].as<uint32_t>();
  r.next_wake_at_ms         = row[13].as<uint64_t>();
  r.next_wake_display       = row[14].c_str();
  r.failure_reason          = row[15].c_str();
  return r;
}

model::ImageTransferRecord ReadTransfer(const pqxx::row& row) {
  model::ImageTransferRecord r;
  r.device_id           = row[0].c_str();
  r.artifact_name       = row[1].c_str();
  r.wake_event_id       = row[2].c_str();
  r.total_fragments     = row[3].as<uint32_t>();
  r.received_fragments  = row[4].as<uint32_t>();
  r.status              = fieldwake::model::TransferStatusFromInt(row[5].as<int>());
  r.failure_code        = fieldwake::model::FailureCodeFromInt(row[6].as<int>());
  r.storage_location    = row[7].c_str();
  r.retry_count         = row[8].as<uint32_t>();
  r.missing_requests    = row[9].as<uint32_t>();
  r.recovery_boundary   = row[10].as<uint32_t>();
  r.capture_timestamp   = row[11].c_str();
  r.image_size          = row[12].as<uint64_t>();
  r.max_chunk_size      = row[13].as<uint32_t>();
  r.created_at_ms       = row[14].as<uint64_t>();
  r.updated_at_ms       = row[15].as<uint64_t>();
  r.last_fragment_at_ms = row[16].as<uint64_t>();
  return r;
}

model::DeviceRecord ReadDevice(const pqxx::row& row) {
  model::DeviceRecord r;
  r.device_id              = row[0].c_str();
  r.provisioning_status    = row[1].c_str();
  r.firmware_version       = row[2].c_str();
  r.hardware_version       = row[3].c_str();
  r.wifi_rssi              = OptField<int32_t>(row[4]);
  r.battery_voltage        = OptField<double>(row[5]);
  r.battery_health_percent = OptField<double>(row[6]);
  r.temperature            = OptField<double>(row[7]);
  r.humidity               = OptField<double>(row[8]);
  r.pressure               = OptField<double>(row[9]);
  r.gas_resistance         = OptField<double>(row[10]);
  r.pending_count          = row[11].as<uint32_t>();
  r.first_seen_at_ms       = row[12].as<uint64_t>();
  r.last_seen_at_ms        = row[13].as<uint64_t>();
  r.last_wake_at_ms        = row[14].as<uint64_t>();
  r.next_wake_at_ms        = row[15].as<uint64_t>();
  r.wake_schedule          = row[16].c_str();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Wake events
// ------------------------------------------------------------------

Result PgRepository::InsertWakeEvent(Transaction& t, const model::WakeEventRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO wake_event(id,device_id,artifact_name,state,hello_at_ms,ack_at_ms,capture_requested_at_ms,"
        "metadata_at_ms,sleep_sent_at_ms,is_complete,images_requested,images_completed,pending_count,next_wake_at_ms,"
        "next_wake_display,failure_reason) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16);",
        r.id, r.device_id, r.artifact_name, static_cast<int>(r.state), r.hello_at_ms, r.ack_at_ms, r.capture_requested_at_ms,
        r.metadata_at_ms, r.sleep_sent_at_ms, r.is_complete, r.images_requested, r.images_completed, r.pending_count,
        r.next_wake_at_ms, r.next_wake_display, r.failure_reason);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateWakeEvent(Transaction& t, const model::WakeEventRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE wake_event SET device_id=$2,artifact_name=$3,state=$4,hello_at_ms=$5,ack_at_ms=$6,"
        "capture_requested_at_ms=$7,metadata_at_ms=$8,sleep_sent_at_ms=$9,is_complete=$10,images_requested=$11,"
        "images_completed=$12,pending_count=$13,next_wake_at_ms=$14,next_wake_display=$15,failure_reason=$16 WHERE id=$1;",
        r.id, r.device_id, r.artifact_name, static_cast<int>(r.state), r.hello_at_ms, r.ack_at_ms, r.capture_requested_at_ms,
        r.metadata_at_ms, r.sleep_sent_at_ms, r.is_complete, r.images_requested, r.images_completed, r.pending_count,
        r.next_wake_at_ms, r.next_wake_display, r.failure_reason);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "wake event " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::WakeEventRecord> PgRepository::GetWakeEvent(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_wake_event", id);
  if (res.empty()) return std::nullopt;
  return ReadWake(res[0]);
}

std::optional<model::WakeEventRecord> PgRepository::LatestWakeEvent(Transaction& t, const std::string& device_id) {
  const std::string sql =
      std::string("SELECT ") + kWakeColumns + " FROM wake_event WHERE device_id=$1 ORDER BY hello_at_ms DESC, seq DESC LIMIT 1;";
  auto res = TX(t).Work().exec_params(sql, device_id);
  if (res.empty()) return std::nullopt;
  return ReadWake(res[0]);
}

std::vector<model::WakeEventRecord> PgRepository::ListWakeEvents(Transaction& t, const std::string& device_id, std::size_t limit) {
  std::string sql = std::string("SELECT ") + kWakeColumns + " FROM wake_event WHERE ($1 = '' OR device_id=$1) ORDER BY hello_at_ms DESC, seq DESC";
  if (limit != 0) sql += " LIMIT " + std::to_string(limit);

  auto res = TX(t).Work().exec_params(sql, device_id);

  std::vector<model::WakeEventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadWake(row));
  return out;
}

// ------------------------------------------------------------------
// Transfers
// ------------------------------------------------------------------

Result PgRepository::UpsertTransfer(Transaction& t, const model::ImageTransferRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO image_transfer(device_id,artifact_name,wake_event_id,total_fragments,received_fragments,status,"
        "failure_code,storage_location,retry_count,missing_requests,recovery_boundary,capture_timestamp,image_size,"
        "max_chunk_size,created_at_ms,updated_at_ms,last_fragment_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17) "
        "ON CONFLICT(device_id,artifact_name) DO UPDATE SET wake_event_id=EXCLUDED.wake_event_id,"
        "total_fragments=EXCLUDED.total_fragments,received_fragments=EXCLUDED.received_fragments,status=EXCLUDED.status,"
        "failure_code=EXCLUDED.failure_code,storage_location=EXCLUDED.storage_location,retry_count=EXCLUDED.retry_count,"
        "missing_requests=EXCLUDED.missing_requests,recovery_boundary=EXCLUDED.recovery_boundary,"
        "capture_timestamp=EXCLUDED.capture_timestamp,image_size=EXCLUDED.image_size,"
        "max_chunk_size=EXCLUDED.max_chunk_size,updated_at_ms=EXCLUDED.updated_at_ms,"
        "last_fragment_at_ms=EXCLUDED.last_fragment_at_ms;",
        r.device_id, r.artifact_name, r.wake_event_id, r.total_fragments, r.received_fragments, static_cast<int>(r.status),
        static_cast<int>(r.failure_code), r.storage_location, r.retry_count, r.missing_requests, r.recovery_boundary,
        r.capture_timestamp, r.image_size, r.max_chunk_size, r.created_at_ms, r.updated_at_ms, r.last_fragment_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ImageTransferRecord> PgRepository::GetTransfer(Transaction& t, const std::string& device_id,
                                                                    const std::string& artifact_name) {
  auto res = TX(t).Work().exec_prepared("get_transfer", device_id, artifact_name);
  if (res.empty()) return std::nullopt;
  return ReadTransfer(res[0]);
}

std::vector<model::ImageTransferRecord> PgRepository::ListTransfers(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT device_id,artifact_name,wake_event_id,total_fragments,received_fragments,status,failure_code,"
      "storage_location,retry_count,missing_requests,recovery_boundary,capture_timestamp,image_size,max_chunk_size,"
      "created_at_ms,updated_at_ms,last_fragment_at_ms FROM image_transfer ORDER BY device_id, artifact_name;");

  std::vector<model::ImageTransferRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadTransfer(row));
  return out;
}

std::vector<model::ImageTransferRecord> PgRepository::ListReceivingTransfers(Transaction& t) {
  auto res = TX(t).Work().exec_params(
      "SELECT device_id,artifact_name,wake_event_id,total_fragments,received_fragments,status,failure_code,"
      "storage_location,retry_count,missing_requests,recovery_boundary,capture_timestamp,image_size,max_chunk_size,"
      "created_at_ms,updated_at_ms,last_fragment_at_ms FROM image_transfer WHERE status=$1 ORDER BY device_id, artifact_name;",
      static_cast<int>(fieldwake::model::TransferStatus::kReceiving));

  std::vector<model::ImageTransferRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadTransfer(row));
  return out;
}

// ------------------------------------------------------------------
// Fragments
// ------------------------------------------------------------------

Result PgRepository::InsertFragment(Transaction& t, const model::FragmentRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_fragment", r.device_id, r.artifact_name, r.index, ToBytes(r.bytes),
                                          r.stored_at_ms, r.expires_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<uint32_t> PgRepository::ListFragmentIndices(Transaction& t, const std::string& device_id, const std::string& artifact_name) {
  auto res = TX(t).Work().exec_prepared("list_fragment_indices", device_id, artifact_name);

  std::vector<uint32_t> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(row[0].as<uint32_t>());
  return out;
}

std::vector<model::FragmentRecord> PgRepository::ListFragments(Transaction& t, const std::string& device_id,
                                                               const std::string& artifact_name) {
  auto res = TX(t).Work().exec_params(
      "SELECT idx,bytes,stored_at_ms,expires_at_ms FROM fragment WHERE device_id=$1 AND artifact_name=$2 ORDER BY idx;",
      device_id, artifact_name);

  std::vector<model::FragmentRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::FragmentRecord r;
    r.device_id     = device_id;
    r.artifact_name = artifact_name;
    r.index         = row[0].as<uint32_t>();
    r.bytes         = FromBytes(row[1].as<Bytes>());
    r.stored_at_ms  = row[2].as<uint64_t>();
    r.expires_at_ms = row[3].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::TouchFragments(Transaction& t, const std::string& device_id, const std::string& artifact_name, uint64_t expires_at_ms) {
  try {
    TX(t).Work().exec_prepared("touch_fragments", device_id, artifact_name, expires_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteFragments(Transaction& t, const std::string& device_id, const std::string& artifact_name, std::size_t& deleted) {
  deleted = 0;
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM fragment WHERE device_id=$1 AND artifact_name=$2;", device_id, artifact_name);
    deleted  = static_cast<std::size_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteExpiredFragments(Transaction& t, uint64_t now_ms, std::vector<model::FragmentKey>& removed) {
  removed.clear();
  try {
    auto res = TX(t).Work().exec_params(
        "WITH gone AS (DELETE FROM fragment WHERE expires_at_ms<=$1 RETURNING device_id, artifact_name) "
        "SELECT DISTINCT device_id, artifact_name FROM gone ORDER BY device_id, artifact_name;",
        now_ms);
    for (const auto& row : res) removed.push_back({row[0].c_str(), row[1].c_str()});
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::CountFragments(Transaction& t) {
  return TX(t).Work().query_value<uint64_t>("SELECT COUNT(*) FROM fragment;");
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result PgRepository::UpsertDevice(Transaction& t, const model::DeviceRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO device(device_id,provisioning_status,firmware_version,hardware_version,wifi_rssi,battery_voltage,"
        "battery_health_percent,temperature,humidity,pressure,gas_resistance,pending_count,first_seen_at_ms,"
        "last_seen_at_ms,last_wake_at_ms,next_wake_at_ms,wake_schedule) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17) "
        "ON CONFLICT(device_id) DO UPDATE SET provisioning_status=EXCLUDED.provisioning_status,"
        "firmware_version=EXCLUDED.firmware_version,hardware_version=EXCLUDED.hardware_version,"
        "wifi_rssi=EXCLUDED.wifi_rssi,battery_voltage=EXCLUDED.battery_voltage,"
        "battery_health_percent=EXCLUDED.battery_health_percent,temperature=EXCLUDED.temperature,"
        "humidity=EXCLUDED.humidity,pressure=EXCLUDED.pressure,gas_resistance=EXCLUDED.gas_resistance,"
        "pending_count=EXCLUDED.pending_count,last_seen_at_ms=EXCLUDED.last_seen_at_ms,"
        "last_wake_at_ms=EXCLUDED.last_wake_at_ms,next_wake_at_ms=EXCLUDED.next_wake_at_ms,"
        "wake_schedule=EXCLUDED.wake_schedule;",
        r.device_id, r.provisioning_status, r.firmware_version, r.hardware_version, r.wifi_rssi, r.battery_voltage,
        r.battery_health_percent, r.temperature, r.humidity, r.pressure, r.gas_resistance, r.pending_count,
        r.first_seen_at_ms, r.last_seen_at_ms, r.last_wake_at_ms, r.next_wake_at_ms, r.wake_schedule);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DeviceRecord> PgRepository::GetDevice(Transaction& t, const std::string& device_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT device_id,provisioning_status,firmware_version,hardware_version,wifi_rssi,battery_voltage,"
      "battery_health_percent,temperature,humidity,pressure,gas_resistance,pending_count,first_seen_at_ms,"
      "last_seen_at_ms,last_wake_at_ms,next_wake_at_ms,wake_schedule FROM device WHERE device_id=$1;",
      device_id);
  if (res.empty()) return std::nullopt;
  return ReadDevice(res[0]);
}

uint64_t PgRepository::CountDevices(Transaction& t) {
  return TX(t).Work().query_value<uint64_t>("SELECT COUNT(*) FROM device;");
}

// ------------------------------------------------------------------
// Journals
// ------------------------------------------------------------------

Result PgRepository::InsertFailure(Transaction& t, const model::FailureRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO failure_journal(id,device_id,artifact_name,wake_event_id,code,message,reported_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7);",
        r.id, r.device_id, r.artifact_name, r.wake_event_id, static_cast<int>(r.code), r.message, r.reported_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::FailureRecord> PgRepository::ListFailures(Transaction& t, const std::string& device_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,device_id,artifact_name,wake_event_id,code,message,reported_at_ms FROM failure_journal "
      "WHERE ($1 = '' OR device_id=$1) ORDER BY reported_at_ms, seq;",
      device_id);

  std::vector<model::FailureRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::FailureRecord r;
    r.id             = row[0].c_str();
    r.device_id      = row[1].c_str();
    r.artifact_name  = row[2].c_str();
    r.wake_event_id  = row[3].c_str();
    r.code           = fieldwake::model::FailureCodeFromInt(row[4].as<int>());
    r.message        = row[5].c_str();
    r.reported_at_ms = row[6].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::InsertArtifactLink(Transaction& t, const model::ArtifactLinkRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO artifact_link(device_id,artifact_name,wake_event_id,storage_location,site_id,program_id,company_id,"
        "size_bytes,linked_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) "
        "ON CONFLICT(device_id,artifact_name) DO UPDATE SET wake_event_id=EXCLUDED.wake_event_id,"
        "storage_location=EXCLUDED.storage_location,site_id=EXCLUDED.site_id,program_id=EXCLUDED.program_id,"
        "company_id=EXCLUDED.company_id,size_bytes=EXCLUDED.size_bytes,linked_at_ms=EXCLUDED.linked_at_ms;",
        r.device_id, r.artifact_name, r.wake_event_id, r.storage_location, r.site_id, r.program_id, r.company_id,
        r.size_bytes, r.linked_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ArtifactLinkRecord> PgRepository::GetArtifactLink(Transaction& t, const std::string& device_id,
                                                                       const std::string& artifact_name) {
  auto res = TX(t).Work().exec_params(
      "SELECT wake_event_id,storage_location,site_id,program_id,company_id,size_bytes,linked_at_ms FROM artifact_link "
      "WHERE device_id=$1 AND artifact_name=$2;",
      device_id, artifact_name);
  if (res.empty()) return std::nullopt;

  model::ArtifactLinkRecord r;
  r.device_id        = device_id;
  r.artifact_name    = artifact_name;
  r.wake_event_id    = res[0][0].c_str();
  r.storage_location = res[0][1].c_str();
  r.site_id          = res[0][2].c_str();
  r.program_id       = res[0][3].c_str();
  r.company_id       = res[0][4].c_str();
  r.size_bytes       = res[0][5].as<uint64_t>();
  r.linked_at_ms     = res[0][6].as<uint64_t>();
  return r;
}

// ------------------------------------------------------------------
// Retention
// ------------------------------------------------------------------

Result PgRepository::PruneBefore(Transaction& t, uint64_t cutoff_ms, PruneCounts& pruned) {
  pruned = PruneCounts{};
  try {
    auto& work = TX(t).Work();

    pruned.wake_events = work.exec_params("DELETE FROM wake_event WHERE hello_at_ms<$1 AND state IN ($2,$3,$4);", cutoff_ms,
                                          static_cast<int>(fieldwake::model::ProtocolState::kComplete),
                                          static_cast<int>(fieldwake::model::ProtocolState::kSleepOnly),
                                          static_cast<int>(fieldwake::model::ProtocolState::kFailed))
                             .affected_rows();
    pruned.transfers = work.exec_params("DELETE FROM image_transfer WHERE updated_at_ms<$1 AND status<>$2;", cutoff_ms,
                                        static_cast<int>(fieldwake::model::TransferStatus::kReceiving))
                           .affected_rows();
    pruned.failures       = work.exec_params("DELETE FROM failure_journal WHERE reported_at_ms<$1;", cutoff_ms).affected_rows();
    pruned.artifact_links = work.exec_params("DELETE FROM artifact_link WHERE linked_at_ms<$1;", cutoff_ms).affected_rows();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace fieldwake::db::postgres
