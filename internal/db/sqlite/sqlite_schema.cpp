#include "sqlite_schema.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace fieldwake::db::sqlite {

namespace {

constexpr int kSchemaVersion = 1;

} // namespace

void BootstrapSchema(SqliteDB& db) {
  const auto stored = db.QueryText("PRAGMA user_version;");
  const int  version = stored.empty() ? 0 : std::stoi(stored);
  if (version > kSchemaVersion) {
    throw std::runtime_error("sqlite schema version " + std::to_string(version) + " in " + db.Path() + " is newer than this build (" +
                             std::to_string(kSchemaVersion) + ")");
  }

  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS wake_event (id TEXT PRIMARY KEY, device_id TEXT NOT NULL, artifact_name TEXT NOT NULL DEFAULT '', state INTEGER NOT NULL, hello_at_ms INTEGER NOT NULL, ack_at_ms INTEGER NOT NULL DEFAULT 0, capture_requested_at_ms INTEGER NOT NULL DEFAULT 0, metadata_at_ms INTEGER NOT NULL DEFAULT 0, sleep_sent_at_ms INTEGER NOT NULL DEFAULT 0, is_complete INTEGER NOT NULL DEFAULT 0, images_requested INTEGER NOT NULL DEFAULT 0, images_completed INTEGER NOT NULL DEFAULT 0, pending_count INTEGER NOT NULL DEFAULT 0, next_wake_at_ms INTEGER NOT NULL DEFAULT 0, next_wake_display TEXT NOT NULL DEFAULT '', failure_reason TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS wake_event_device_hello ON wake_event(device_id, hello_at_ms);",
      "CREATE INDEX IF NOT EXISTS wake_event_hello ON wake_event(hello_at_ms);",
      "CREATE TABLE IF NOT EXISTS image_transfer (device_id TEXT NOT NULL, artifact_name TEXT NOT NULL, wake_event_id TEXT NOT NULL DEFAULT '', total_fragments INTEGER NOT NULL DEFAULT 0, received_fragments INTEGER NOT NULL DEFAULT 0, status INTEGER NOT NULL, failure_code INTEGER NOT NULL DEFAULT 0, storage_location TEXT NOT NULL DEFAULT '', retry_count INTEGER NOT NULL DEFAULT 0, missing_requests INTEGER NOT NULL DEFAULT 0, recovery_boundary INTEGER NOT NULL DEFAULT 0, capture_timestamp TEXT NOT NULL DEFAULT '', image_size INTEGER NOT NULL DEFAULT 0, max_chunk_size INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, last_fragment_at_ms INTEGER NOT NULL DEFAULT 0, PRIMARY KEY (device_id, artifact_name));",
      "CREATE INDEX IF NOT EXISTS image_transfer_status ON image_transfer(status, updated_at_ms);",
      "CREATE TABLE IF NOT EXISTS fragment (device_id TEXT NOT NULL, artifact_name TEXT NOT NULL, idx INTEGER NOT NULL, bytes BLOB NOT NULL, stored_at_ms INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL, PRIMARY KEY (device_id, artifact_name, idx));",
      "CREATE INDEX IF NOT EXISTS fragment_expiry ON fragment(expires_at_ms);",
      "CREATE TABLE IF NOT EXISTS device (device_id TEXT PRIMARY KEY, provisioning_status TEXT NOT NULL DEFAULT '', firmware_version TEXT NOT NULL DEFAULT '', hardware_version TEXT NOT NULL DEFAULT '', wifi_rssi INTEGER, battery_voltage REAL, battery_health_percent REAL, temperature REAL, humidity REAL, pressure REAL, gas_resistance REAL, pending_count INTEGER NOT NULL DEFAULT 0, first_seen_at_ms INTEGER NOT NULL, last_seen_at_ms INTEGER NOT NULL, last_wake_at_ms INTEGER NOT NULL DEFAULT 0, next_wake_at_ms INTEGER NOT NULL DEFAULT 0, wake_schedule TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS failure_journal (id TEXT PRIMARY KEY, device_id TEXT NOT NULL, artifact_name TEXT NOT NULL, wake_event_id TEXT NOT NULL DEFAULT '', code INTEGER NOT NULL, message TEXT NOT NULL DEFAULT '', reported_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS artifact_link (device_id TEXT NOT NULL, artifact_name TEXT NOT NULL, wake_event_id TEXT NOT NULL DEFAULT '', storage_location TEXT NOT NULL, site_id TEXT NOT NULL DEFAULT '', program_id TEXT NOT NULL DEFAULT '', company_id TEXT NOT NULL DEFAULT '', size_bytes INTEGER NOT NULL DEFAULT 0, linked_at_ms INTEGER NOT NULL, PRIMARY KEY (device_id, artifact_name));"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT id,device_id,state,hello_at_ms FROM wake_event LIMIT 1;");
  db.Exec("SELECT device_id,artifact_name,status,recovery_boundary FROM image_transfer LIMIT 1;");
  db.Exec("SELECT device_id,artifact_name,idx,expires_at_ms FROM fragment LIMIT 1;");
  db.Exec("SELECT device_id,next_wake_at_ms FROM device LIMIT 1;");
  db.Exec("SELECT id,code FROM failure_journal LIMIT 1;");
  db.Exec("SELECT device_id,storage_location FROM artifact_link LIMIT 1;");

  if (version < kSchemaVersion) {
    db.Exec("PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";");
  }
}

} // namespace fieldwake::db::sqlite
