#include "pg_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace fieldwake::db::postgres {

namespace {

// "fieldwk" packed into the advisory lock keyspace.
constexpr long long kWriterLockKey = 0x6669656c64776bLL;

} // namespace

PgTransaction::PgTransaction(const std::shared_ptr<PgPool>& pool) : conn_(pool->Acquire()) {
  tx_ = std::make_unique<pqxx::work>(*conn_);
  tx_->exec_params("SELECT pg_advisory_xact_lock($1)", kWriterLockKey);
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    FIELDWAKE_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  if (finished_) throw std::logic_error("postgres transaction already finished");
  tx_->commit();
  finished_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) throw std::logic_error("postgres transaction already finished");
  finished_ = true;
  tx_->abort();
}

} // namespace fieldwake::db::postgres
