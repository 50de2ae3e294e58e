#pragma once

namespace fieldwake::db {

/*
  One unit of engine work against the repository: a router step, a
  finalize phase or a sweep pass.

  Every backend guarantees:

  - writes are invisible to other transactions until Commit()
  - Rollback(), or destruction without Commit(), discards them
  - writers are serialized, so a fragment insert and the completeness
    check that follows it see the same set of stored indices

  Memory and SQLite hold a process-wide write lock for the lifetime of
  the transaction; Postgres takes a transaction-scoped advisory lock.
  Transactions never nest: a second Begin() on the same thread blocks.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsCommitted() const = 0;
};

} // namespace fieldwake::db
