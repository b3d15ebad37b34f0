#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace upload::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    UPLOAD_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw util::Conflict(std::string("postgres serialization failure: ") + e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw util::Conflict(std::string("postgres deadlock: ") + e.what());
  } catch (const pqxx::broken_connection& e) {
    throw util::StorageError(std::string("postgres connection lost: ") + e.what());
  }
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

} // namespace upload::db::postgres
