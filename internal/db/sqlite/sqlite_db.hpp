#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace fieldwake::db::sqlite {

struct SqliteOptions {
  // WAL lets admin reads proceed while the router holds the write lock.
  bool wal_mode = true;
  int  busy_timeout_ms = 5000;
};

/*
  Owns the single sqlite3 connection fieldwake writes through.

  Every SqliteTransaction locks WriteMutex() for its lifetime, so router,
  finalizer and sweeper steps never interleave on the shared handle.
  The parent directory of the database file is created on open.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }
  const std::string& Path() const {
    return path_;
  }
  std::mutex& WriteMutex() {
    return write_mutex_;
  }

  // Runs one or more statements; throws std::runtime_error with the sqlite message.
  void Exec(const std::string& sql);

  // First column of the first row as text, empty when there is no row.
  std::string QueryText(const std::string& sql);

 private:
  void Configure(const SqliteOptions& options);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  write_mutex_;
};

} // namespace fieldwake::db::sqlite
