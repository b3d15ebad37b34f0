#include "pg_pool.hpp"

namespace upload::db::postgres {

namespace {

constexpr const char* kSessionColumns =
    "token,owner_id,filename,file_size,chunk_size,total_chunks,received_chunks,status,"
    "created_at_ms,expires_at_ms,completed_at_ms,updated_at_ms,artifact_id,artifact_path,"
    "notified,finalize_failures,version";

std::string SelectSessions(const char* where) {
  return std::string("SELECT ") + kSessionColumns + " FROM upload_sessions WHERE " + where;
}

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::BootstrapSchema() {
  // statements are prepared against the tables, so create them on a raw connection first
  pqxx::connection conn(conninfo_);
  pqxx::work       tx(conn);
  tx.exec(
      "CREATE TABLE IF NOT EXISTS upload_sessions ("
      " token TEXT PRIMARY KEY,"
      " owner_id TEXT NOT NULL,"
      " filename TEXT NOT NULL,"
      " file_size BIGINT NOT NULL,"
      " chunk_size INTEGER NOT NULL,"
      " total_chunks INTEGER NOT NULL,"
      " received_chunks INTEGER NOT NULL CHECK (received_chunks >= 0 AND received_chunks <= total_chunks),"
      " status INTEGER NOT NULL,"
      " created_at_ms BIGINT NOT NULL,"
      " expires_at_ms BIGINT NOT NULL,"
      " completed_at_ms BIGINT NOT NULL DEFAULT 0,"
      " updated_at_ms BIGINT NOT NULL,"
      " artifact_id TEXT NOT NULL,"
      " artifact_path TEXT NOT NULL DEFAULT '',"
      " notified BOOLEAN NOT NULL DEFAULT FALSE,"
      " finalize_failures INTEGER NOT NULL DEFAULT 0,"
      " version BIGINT NOT NULL DEFAULT 0)");
  tx.exec("CREATE INDEX IF NOT EXISTS upload_sessions_owner ON upload_sessions(owner_id)");
  tx.exec("CREATE INDEX IF NOT EXISTS upload_sessions_status ON upload_sessions(status, expires_at_ms)");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS upload_session_chunks ("
      " token TEXT NOT NULL REFERENCES upload_sessions(token) ON DELETE CASCADE,"
      " chunk_index INTEGER NOT NULL,"
      " digest TEXT NOT NULL DEFAULT '',"
      " received_at_ms BIGINT NOT NULL,"
      " PRIMARY KEY(token, chunk_index))");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS upload_artifacts ("
      " artifact_id TEXT PRIMARY KEY,"
      " owner_id TEXT NOT NULL,"
      " original_filename TEXT NOT NULL,"
      " path TEXT NOT NULL,"
      " size_bytes BIGINT NOT NULL,"
      " mime_type TEXT NOT NULL,"
      " session_token TEXT NOT NULL,"
      " created_at_ms BIGINT NOT NULL)");
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_session", std::string("INSERT INTO upload_sessions(") + kSessionColumns +
                                     ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17)");

  // FOR UPDATE: the row lock makes concurrent read-modify-write serialize
  conn.prepare("get_session", SelectSessions("token=$1 FOR UPDATE"));

  conn.prepare("update_session",
               "UPDATE upload_sessions SET received_chunks=$2,status=$3,completed_at_ms=$4,updated_at_ms=$5,"
               "expires_at_ms=$6,artifact_path=$7,notified=$8,finalize_failures=$9,version=$10 WHERE token=$1");

  conn.prepare("delete_session", "DELETE FROM upload_sessions WHERE token=$1");
  conn.prepare("delete_session_chunks", "DELETE FROM upload_session_chunks WHERE token=$1");

  conn.prepare("list_sessions_by_owner", SelectSessions("owner_id=$1"));
  conn.prepare("list_sessions_by_status", SelectSessions("status=$1"));

  conn.prepare("insert_chunk",
               "INSERT INTO upload_session_chunks(token,chunk_index,digest,received_at_ms) VALUES($1,$2,$3,$4) "
               "ON CONFLICT (token, chunk_index) DO NOTHING");
  conn.prepare("get_chunk",
               "SELECT token,chunk_index,digest,received_at_ms FROM upload_session_chunks "
               "WHERE token=$1 AND chunk_index=$2");
  conn.prepare("list_chunk_indices",
               "SELECT chunk_index FROM upload_session_chunks WHERE token=$1 ORDER BY chunk_index");

  conn.prepare("insert_artifact",
               "INSERT INTO upload_artifacts(artifact_id,owner_id,original_filename,path,size_bytes,mime_type,"
               "session_token,created_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8)");
  conn.prepare("get_artifact",
               "SELECT artifact_id,owner_id,original_filename,path,size_bytes,mime_type,session_token,created_at_ms "
               "FROM upload_artifacts WHERE artifact_id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (!conn->is_open()) {
      --live_connections_;
      delete conn;
    } else {
      idle_.emplace_back(conn);
    }
  }
  cv_.notify_one();
}

} // namespace upload::db::postgres
