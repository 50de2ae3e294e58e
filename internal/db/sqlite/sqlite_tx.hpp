#pragma once

#include <chrono>
#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace fieldwake::db::sqlite {

/*
  BEGIN IMMEDIATE under the connection's write mutex. The write lock is
  taken up front so a router step never has to upgrade half way through.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return finished_;
  }

 private:
  void Finish(const char* sql);

  std::shared_ptr<SqliteDB>             db_;
  std::unique_lock<std::mutex>          lock_;
  std::chrono::steady_clock::time_point started_;
  bool                                  finished_ = false;
};

} // namespace fieldwake::db::sqlite
