#pragma once

namespace upload::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws util::Conflict when a concurrent transaction won;
    callers re-run the whole unit of work

  SQLite:   BEGIN IMMEDIATE (writers serialize on the file lock)
  Postgres: pqxx::work, serialization failures map to Conflict
  Memory:   per-session views + commit-time stamp check
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  // true once Commit() or Rollback() ran
  virtual bool IsFinished() const = 0;
};

} // namespace upload::db
