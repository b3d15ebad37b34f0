#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/errors.hpp"

namespace upload::db::sqlite {

using upload::db::ErrorCode;
using upload::db::Result;

namespace {

constexpr const char* kSessionColumns =
    "token,owner_id,filename,file_size,chunk_size,total_chunks,received_chunks,status,"
    "created_at_ms,expires_at_ms,completed_at_ms,updated_at_ms,artifact_id,artifact_path,"
    "notified,finalize_failures,version";

/*
  Finalizes on scope exit so early returns never leak a statement.
*/
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
      throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

// Steps once; errors come back as extended result codes.
int Step(sqlite3_stmt* st, sqlite3* db) {
  int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE && rc != SQLITE_ROW) return sqlite3_extended_errcode(db);
  return rc;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

// Binds the 17 session columns in kSessionColumns order starting at `first`.
void BindSession(sqlite3_stmt* st, int first, const model::SessionRecord& r) {
  BindText(st, first + 0, r.token);
  BindText(st, first + 1, r.owner_id);
  BindText(st, first + 2, r.filename);
  BindU64(st, first + 3, r.file_size);
  BindI32(st, first + 4, static_cast<int>(r.chunk_size));
  BindI32(st, first + 5, static_cast<int>(r.total_chunks));
  BindI32(st, first + 6, static_cast<int>(r.received_chunks));
  BindI32(st, first + 7, static_cast<int>(r.status));
  BindU64(st, first + 8, r.created_at_ms);
  BindU64(st, first + 9, r.expires_at_ms);
  BindU64(st, first + 10, r.completed_at_ms);
  BindU64(st, first + 11, r.updated_at_ms);
  BindText(st, first + 12, r.artifact_id);
  BindText(st, first + 13, r.artifact_path);
  BindI32(st, first + 14, r.notified ? 1 : 0);
  BindI32(st, first + 15, static_cast<int>(r.finalize_failures));
  BindU64(st, first + 16, r.version);
}

model::SessionRecord ReadSession(sqlite3_stmt* st) {
  model::SessionRecord r;
  r.token             = ColText(st, 0);
  r.owner_id          = ColText(st, 1);
  r.filename          = ColText(st, 2);
  r.file_size         = ColU64(st, 3);
  r.chunk_size        = static_cast<uint32_t>(ColI32(st, 4));
  r.total_chunks      = static_cast<uint32_t>(ColI32(st, 5));
  r.received_chunks   = static_cast<uint32_t>(ColI32(st, 6));
  r.status            = static_cast<upload::manager::v1::SessionStatus>(ColI32(st, 7));
  r.created_at_ms     = ColU64(st, 8);
  r.expires_at_ms     = ColU64(st, 9);
  r.completed_at_ms   = ColU64(st, 10);
  r.updated_at_ms     = ColU64(st, 11);
  r.artifact_id       = ColText(st, 12);
  r.artifact_path     = ColText(st, 13);
  r.notified          = ColI32(st, 14) != 0;
  r.finalize_failures = static_cast<uint32_t>(ColI32(st, 15));
  r.version           = ColU64(st, 16);
  return r;
}

std::vector<model::SessionRecord> ReadSessions(sqlite3_stmt* st) {
  std::vector<model::SessionRecord> out;
  while (sqlite3_step(st) == SQLITE_ROW) out.push_back(ReadSession(st));
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  const char* ddl[] = {
      "CREATE TABLE IF NOT EXISTS upload_sessions ("
      " token TEXT PRIMARY KEY,"
      " owner_id TEXT NOT NULL,"
      " filename TEXT NOT NULL,"
      " file_size INTEGER NOT NULL,"
      " chunk_size INTEGER NOT NULL,"
      " total_chunks INTEGER NOT NULL,"
      " received_chunks INTEGER NOT NULL,"
      " status INTEGER NOT NULL,"
      " created_at_ms INTEGER NOT NULL,"
      " expires_at_ms INTEGER NOT NULL,"
      " completed_at_ms INTEGER NOT NULL DEFAULT 0,"
      " updated_at_ms INTEGER NOT NULL,"
      " artifact_id TEXT NOT NULL,"
      " artifact_path TEXT NOT NULL DEFAULT '',"
      " notified INTEGER NOT NULL DEFAULT 0,"
      " finalize_failures INTEGER NOT NULL DEFAULT 0,"
      " version INTEGER NOT NULL DEFAULT 0,"
      " CHECK (received_chunks >= 0 AND received_chunks <= total_chunks));",
      "CREATE INDEX IF NOT EXISTS upload_sessions_owner ON upload_sessions(owner_id);",
      "CREATE INDEX IF NOT EXISTS upload_sessions_status ON upload_sessions(status, expires_at_ms);",
      "CREATE TABLE IF NOT EXISTS upload_session_chunks ("
      " token TEXT NOT NULL REFERENCES upload_sessions(token) ON DELETE CASCADE,"
      " chunk_index INTEGER NOT NULL,"
      " digest TEXT NOT NULL DEFAULT '',"
      " received_at_ms INTEGER NOT NULL,"
      " PRIMARY KEY(token, chunk_index));",
      "CREATE TABLE IF NOT EXISTS upload_artifacts ("
      " artifact_id TEXT PRIMARY KEY,"
      " owner_id TEXT NOT NULL,"
      " original_filename TEXT NOT NULL,"
      " path TEXT NOT NULL,"
      " size_bytes INTEGER NOT NULL,"
      " mime_type TEXT NOT NULL,"
      " session_token TEXT NOT NULL,"
      " created_at_ms INTEGER NOT NULL);",
  };
  for (const char* sql : ddl) db.Exec(sql);
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  auto* db = TX(t).Handle();
  Statement st(db, std::string("INSERT INTO upload_sessions(") + kSessionColumns +
                       ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  BindSession(st.get(), 1, r);
  return Translate(db, Step(st.get(), db));
}

std::optional<model::SessionRecord> SqliteRepository::GetSession(Transaction& t, const std::string& token) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("SELECT ") + kSessionColumns + " FROM upload_sessions WHERE token=?;");
  BindText(st.get(), 1, token);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadSession(st.get());
}

Result SqliteRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE upload_sessions SET received_chunks=?,status=?,completed_at_ms=?,updated_at_ms=?,"
               "expires_at_ms=?,artifact_path=?,notified=?,finalize_failures=?,version=? WHERE token=?;");
  BindI32(st.get(), 1, static_cast<int>(r.received_chunks));
  BindI32(st.get(), 2, static_cast<int>(r.status));
  BindU64(st.get(), 3, r.completed_at_ms);
  BindU64(st.get(), 4, r.updated_at_ms);
  BindU64(st.get(), 5, r.expires_at_ms);
  BindText(st.get(), 6, r.artifact_path);
  BindI32(st.get(), 7, r.notified ? 1 : 0);
  BindI32(st.get(), 8, static_cast<int>(r.finalize_failures));
  BindU64(st.get(), 9, r.version);
  BindText(st.get(), 10, r.token);

  auto result = Translate(db, Step(st.get(), db));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "session not found");
  return Result::Ok();
}

Result SqliteRepository::DeleteSession(Transaction& t, const std::string& token) {
  auto* db = TX(t).Handle();
  {
    Statement st(db, "DELETE FROM upload_session_chunks WHERE token=?;");
    BindText(st.get(), 1, token);
    auto result = Translate(db, Step(st.get(), db));
    if (!result) return result;
  }
  Statement st(db, "DELETE FROM upload_sessions WHERE token=?;");
  BindText(st.get(), 1, token);
  return Translate(db, Step(st.get(), db));
}

std::vector<model::SessionRecord> SqliteRepository::ListSessionsByOwner(Transaction& t, const std::string& owner_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("SELECT ") + kSessionColumns + " FROM upload_sessions WHERE owner_id=?;");
  BindText(st.get(), 1, owner_id);
  return ReadSessions(st.get());
}

std::vector<model::SessionRecord> SqliteRepository::ListSessionsByStatus(Transaction& t, upload::manager::v1::SessionStatus status) {
  auto*     db = TX(t).Handle();
  Statement st(db, std::string("SELECT ") + kSessionColumns + " FROM upload_sessions WHERE status=?;");
  BindI32(st.get(), 1, static_cast<int>(status));
  return ReadSessions(st.get());
}

// ------------------------------------------------------------------
// Chunks
// ------------------------------------------------------------------

Result SqliteRepository::InsertChunk(Transaction& t, const model::ChunkRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO upload_session_chunks(token,chunk_index,digest,received_at_ms) VALUES(?,?,?,?);");
  BindText(st.get(), 1, r.token);
  BindI32(st.get(), 2, static_cast<int>(r.chunk_index));
  BindText(st.get(), 3, r.digest);
  BindU64(st.get(), 4, r.received_at_ms);
  return Translate(db, Step(st.get(), db));
}

std::optional<model::ChunkRecord> SqliteRepository::GetChunk(Transaction& t, const std::string& token, uint32_t chunk_index) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT token,chunk_index,digest,received_at_ms FROM upload_session_chunks WHERE token=? AND chunk_index=?;");
  BindText(st.get(), 1, token);
  BindI32(st.get(), 2, static_cast<int>(chunk_index));

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::ChunkRecord r;
  r.token          = ColText(st.get(), 0);
  r.chunk_index    = static_cast<uint32_t>(ColI32(st.get(), 1));
  r.digest         = ColText(st.get(), 2);
  r.received_at_ms = ColU64(st.get(), 3);
  return r;
}

std::vector<uint32_t> SqliteRepository::ListChunkIndices(Transaction& t, const std::string& token) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT chunk_index FROM upload_session_chunks WHERE token=? ORDER BY chunk_index;");
  BindText(st.get(), 1, token);

  std::vector<uint32_t> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(static_cast<uint32_t>(ColI32(st.get(), 0)));
  return out;
}

// ------------------------------------------------------------------
// Artifacts
// ------------------------------------------------------------------

Result SqliteRepository::InsertArtifact(Transaction& t, const model::ArtifactRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO upload_artifacts(artifact_id,owner_id,original_filename,path,size_bytes,mime_type,"
               "session_token,created_at_ms) VALUES(?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.artifact_id);
  BindText(st.get(), 2, r.owner_id);
  BindText(st.get(), 3, r.original_filename);
  BindText(st.get(), 4, r.path);
  BindU64(st.get(), 5, r.size_bytes);
  BindText(st.get(), 6, r.mime_type);
  BindText(st.get(), 7, r.session_token);
  BindU64(st.get(), 8, r.created_at_ms);
  return Translate(db, Step(st.get(), db));
}

std::optional<model::ArtifactRecord> SqliteRepository::GetArtifact(Transaction& t, const std::string& artifact_id) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "SELECT artifact_id,owner_id,original_filename,path,size_bytes,mime_type,session_token,created_at_ms "
               "FROM upload_artifacts WHERE artifact_id=?;");
  BindText(st.get(), 1, artifact_id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::ArtifactRecord r;
  r.artifact_id       = ColText(st.get(), 0);
  r.owner_id          = ColText(st.get(), 1);
  r.original_filename = ColText(st.get(), 2);
  r.path              = ColText(st.get(), 3);
  r.size_bytes        = ColU64(st.get(), 4);
  r.mime_type         = ColText(st.get(), 5);
  r.session_token     = ColText(st.get(), 6);
  r.created_at_ms     = ColU64(st.get(), 7);
  return r;
}

} // namespace upload::db::sqlite
