#include "sqlite_tx.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace fieldwake::db::sqlite {

namespace {

// Router steps are a handful of row writes; anything slower is stalling devices.
constexpr auto kSlowTransaction = std::chrono::milliseconds(250);

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)), lock_(db_->WriteMutex()), started_(std::chrono::steady_clock::now()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    FIELDWAKE_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  Finish("COMMIT;");
}

void SqliteTransaction::Rollback() {
  Finish("ROLLBACK;");
}

void SqliteTransaction::Finish(const char* sql) {
  if (finished_) {
    throw std::logic_error("sqlite transaction already finished");
  }
  db_->Exec(sql);
  finished_ = true;

  const auto held = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_);
  lock_.unlock();

  if (held > kSlowTransaction) {
    FIELDWAKE_LOG_WARN("slow sqlite transaction", {observability::StringField("path", db_->Path()), observability::IntField("held_ms", held.count())});
  }
}

} // namespace fieldwake::db::sqlite
