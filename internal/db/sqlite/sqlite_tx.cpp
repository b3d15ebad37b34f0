#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

#include "internal/util/errors.hpp"

namespace upload::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), writer_(db_->writer_mutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    UPLOAD_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  finished_ = true;
  try {
    db_->Exec("COMMIT;");
  } catch (const util::Conflict&) {
    // COMMIT left the transaction open; release it so the retry can begin
    db_->Exec("ROLLBACK;");
    throw;
  }
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace upload::db::sqlite
