#include "pg_pool.hpp"

namespace fieldwake::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_fragment",
               "INSERT INTO fragment(device_id,artifact_name,idx,bytes,stored_at_ms,expires_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6) ON CONFLICT (device_id,artifact_name,idx) DO NOTHING");

  conn.prepare("list_fragment_indices",
               "SELECT idx FROM fragment WHERE device_id=$1 AND artifact_name=$2 ORDER BY idx");

  conn.prepare("touch_fragments",
               "UPDATE fragment SET expires_at_ms=$3 WHERE device_id=$1 AND artifact_name=$2");

  conn.prepare("get_transfer",
               "SELECT device_id,artifact_name,wake_event_id,total_fragments,received_fragments,status,failure_code,"
               "storage_location,retry_count,missing_requests,recovery_boundary,capture_timestamp,image_size,"
               "max_chunk_size,created_at_ms,updated_at_ms,last_fragment_at_ms "
               "FROM image_transfer WHERE device_id=$1 AND artifact_name=$2");

  conn.prepare("get_wake_event",
               "SELECT id,device_id,artifact_name,state,hello_at_ms,ack_at_ms,capture_requested_at_ms,metadata_at_ms,"
               "sleep_sent_at_ms,is_complete,images_requested,images_completed,pending_count,next_wake_at_ms,"
               "next_wake_display,failure_reason FROM wake_event WHERE id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace fieldwake::db::postgres
