#include "pg_schema.hpp"

namespace fieldwake::db::postgres {

void BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS wake_event (id TEXT PRIMARY KEY, seq BIGSERIAL, device_id TEXT NOT NULL, artifact_name TEXT NOT NULL DEFAULT '', state SMALLINT NOT NULL, hello_at_ms BIGINT NOT NULL, ack_at_ms BIGINT NOT NULL DEFAULT 0, capture_requested_at_ms BIGINT NOT NULL DEFAULT 0, metadata_at_ms BIGINT NOT NULL DEFAULT 0, sleep_sent_at_ms BIGINT NOT NULL DEFAULT 0, is_complete BOOLEAN NOT NULL DEFAULT FALSE, images_requested INTEGER NOT NULL DEFAULT 0, images_completed INTEGER NOT NULL DEFAULT 0, pending_count INTEGER NOT NULL DEFAULT 0, next_wake_at_ms BIGINT NOT NULL DEFAULT 0, next_wake_display TEXT NOT NULL DEFAULT '', failure_reason TEXT NOT NULL DEFAULT '');");
  tx.exec("CREATE INDEX IF NOT EXISTS wake_event_device_hello ON wake_event(device_id, hello_at_ms);");
  tx.exec("CREATE INDEX IF NOT EXISTS wake_event_hello ON wake_event(hello_at_ms);");
  tx.exec("CREATE TABLE IF NOT EXISTS image_transfer (device_id TEXT NOT NULL, artifact_name TEXT NOT NULL, wake_event_id TEXT NOT NULL DEFAULT '', total_fragments BIGINT NOT NULL DEFAULT 0, received_fragments BIGINT NOT NULL DEFAULT 0, status SMALLINT NOT NULL, failure_code SMALLINT NOT NULL DEFAULT 0, storage_location TEXT NOT NULL DEFAULT '', retry_count BIGINT NOT NULL DEFAULT 0, missing_requests BIGINT NOT NULL DEFAULT 0, recovery_boundary BIGINT NOT NULL DEFAULT 0, capture_timestamp TEXT NOT NULL DEFAULT '', image_size BIGINT NOT NULL DEFAULT 0, max_chunk_size BIGINT NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, last_fragment_at_ms BIGINT NOT NULL DEFAULT 0, PRIMARY KEY (device_id, artifact_name));");
  tx.exec("CREATE INDEX IF NOT EXISTS image_transfer_status ON image_transfer(status, updated_at_ms);");
  tx.exec("CREATE TABLE IF NOT EXISTS fragment (device_id TEXT NOT NULL, artifact_name TEXT NOT NULL, idx BIGINT NOT NULL, bytes BYTEA NOT NULL, stored_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL, PRIMARY KEY (device_id, artifact_name, idx));");
  tx.exec("CREATE INDEX IF NOT EXISTS fragment_expiry ON fragment(expires_at_ms);");
  tx.exec("CREATE TABLE IF NOT EXISTS device (device_id TEXT PRIMARY KEY, provisioning_status TEXT NOT NULL DEFAULT '', firmware_version TEXT NOT NULL DEFAULT '', hardware_version TEXT NOT NULL DEFAULT '', wifi_rssi INTEGER, battery_voltage DOUBLE PRECISION, battery_health_percent DOUBLE PRECISION, temperature DOUBLE PRECISION, humidity DOUBLE PRECISION, pressure DOUBLE PRECISION, gas_resistance DOUBLE PRECISION, pending_count INTEGER NOT NULL DEFAULT 0, first_seen_at_ms BIGINT NOT NULL, last_seen_at_ms BIGINT NOT NULL, last_wake_at_ms BIGINT NOT NULL DEFAULT 0, next_wake_at_ms BIGINT NOT NULL DEFAULT 0, wake_schedule TEXT NOT NULL DEFAULT '');");
  tx.exec("CREATE TABLE IF NOT EXISTS failure_journal (id TEXT PRIMARY KEY, seq BIGSERIAL, device_id TEXT NOT NULL, artifact_name TEXT NOT NULL, wake_event_id TEXT NOT NULL DEFAULT '', code SMALLINT NOT NULL, message TEXT NOT NULL DEFAULT '', reported_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS artifact_link (device_id TEXT NOT NULL, artifact_name TEXT NOT NULL, wake_event_id TEXT NOT NULL DEFAULT '', storage_location TEXT NOT NULL, site_id TEXT NOT NULL DEFAULT '', program_id TEXT NOT NULL DEFAULT '', company_id TEXT NOT NULL DEFAULT '', size_bytes BIGINT NOT NULL DEFAULT 0, linked_at_ms BIGINT NOT NULL, PRIMARY KEY (device_id, artifact_name));");

  tx.exec("SELECT id,device_id,state,hello_at_ms FROM wake_event LIMIT 1;");
  tx.exec("SELECT device_id,artifact_name,status,recovery_boundary FROM image_transfer LIMIT 1;");
  tx.exec("SELECT device_id,artifact_name,idx,expires_at_ms FROM fragment LIMIT 1;");
  tx.exec("SELECT device_id,next_wake_at_ms FROM device LIMIT 1;");
  tx.commit();
}

} // namespace fieldwake::db::postgres
