#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace upload::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs the write lock early
    - a busy database surfaces at Begin(), before any work is done
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override { return finished_; }

private:
  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> writer_;
  bool finished_ = false;
};

} // namespace upload::db::sqlite
