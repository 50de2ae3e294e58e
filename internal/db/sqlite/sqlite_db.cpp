#include "sqlite_db.hpp"

#include <filesystem>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace fieldwake::db::sqlite {

namespace {

std::runtime_error SqliteError(const std::string& what, sqlite3* db) {
  return std::runtime_error(what + ": " + (db ? sqlite3_errmsg(db) : "out of memory"));
}

} // namespace

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)) {
  const auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty() && path_ != ":memory:") {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("create database directory " + parent.string() + ": " + ec.message());
    }
  }

  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    auto error = SqliteError("open " + path_, db_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw error;
  }

  try {
    Configure(options);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }

  FIELDWAKE_LOG_INFO("sqlite database opened", {observability::StringField("path", path_), observability::BoolField("wal", options.wal_mode)});
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

std::string SqliteDB::QueryText(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    sqlite3_finalize(stmt);
    throw SqliteError("prepare", db_);
  }

  std::string out;
  const int   rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    const auto* text = sqlite3_column_text(stmt, 0);
    if (text != nullptr) out = reinterpret_cast<const char*>(text);
  }
  sqlite3_finalize(stmt);

  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw SqliteError("query", db_);
  }
  return out;
}

void SqliteDB::Configure(const SqliteOptions& options) {
  if (options.wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  } else {
    // rollback journal: FULL keeps a finalized transfer on disk across power loss
    Exec("PRAGMA journal_mode=DELETE;");
    Exec("PRAGMA synchronous=FULL;");
  }

  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA temp_store=MEMORY;");

  if (sqlite3_busy_timeout(db_, options.busy_timeout_ms) != SQLITE_OK) {
    throw SqliteError("busy_timeout", db_);
  }
}

} // namespace fieldwake::db::sqlite
