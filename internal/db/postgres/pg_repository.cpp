#include "pg_repository.hpp"

#include "upload/manager/v1.hpp"

namespace upload::db::postgres {

namespace {

model::SessionRecord ReadSession(const pqxx::row& row) {
  model::SessionRecord r;
  r.token             = row[0].c_str();
  r.owner_id          = row[1].c_str();
  r.filename          = row[2].c_str();
  r.file_size         = row[3].as<uint64_t>();
  r.chunk_size        = row[4].as<uint32_t>();
  r.total_chunks      = row[5].as<uint32_t>();
  r.received_chunks   = row[6].as<uint32_t>();
  r.status            = static_cast<upload::manager::v1::SessionStatus>(row[7].as<int>());
  r.created_at_ms     = row[8].as<uint64_t>();
  r.expires_at_ms     = row[9].as<uint64_t>();
  r.completed_at_ms   = row[10].as<uint64_t>();
  r.updated_at_ms     = row[11].as<uint64_t>();
  r.artifact_id       = row[12].c_str();
  r.artifact_path     = row[13].c_str();
  r.notified          = row[14].as<bool>();
  r.finalize_failures = row[15].as<uint32_t>();
  r.version           = row[16].as<uint64_t>();
  return r;
}

std::vector<model::SessionRecord> ReadSessions(const pqxx::result& res) {
  std::vector<model::SessionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadSession(row));
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e))
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e))
    return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result PgRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_session", r.token, r.owner_id, r.filename, r.file_size, r.chunk_size,
                               r.total_chunks, r.received_chunks, static_cast<int>(r.status), r.created_at_ms,
                               r.expires_at_ms, r.completed_at_ms, r.updated_at_ms, r.artifact_id, r.artifact_path,
                               r.notified, r.finalize_failures, r.version);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SessionRecord> PgRepository::GetSession(Transaction& t, const std::string& token) {
  auto res = TX(t).Work().exec_prepared("get_session", token);
  if (res.empty()) return std::nullopt;
  return ReadSession(res[0]);
}

Result PgRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_session", r.token, r.received_chunks, static_cast<int>(r.status),
                                          r.completed_at_ms, r.updated_at_ms, r.expires_at_ms, r.artifact_path,
                                          r.notified, r.finalize_failures, r.version);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "session not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteSession(Transaction& t, const std::string& token) {
  try {
    TX(t).Work().exec_prepared("delete_session_chunks", token);
    TX(t).Work().exec_prepared("delete_session", token);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SessionRecord> PgRepository::ListSessionsByOwner(Transaction& t, const std::string& owner_id) {
  return ReadSessions(TX(t).Work().exec_prepared("list_sessions_by_owner", owner_id));
}

std::vector<model::SessionRecord> PgRepository::ListSessionsByStatus(Transaction& t, upload::manager::v1::SessionStatus status) {
  return ReadSessions(TX(t).Work().exec_prepared("list_sessions_by_status", static_cast<int>(status)));
}

// ------------------------------------------------------------------
// Chunks
// ------------------------------------------------------------------

Result PgRepository::InsertChunk(Transaction& t, const model::ChunkRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_chunk", r.token, r.chunk_index, r.digest, r.received_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ChunkRecord> PgRepository::GetChunk(Transaction& t, const std::string& token, uint32_t chunk_index) {
  auto res = TX(t).Work().exec_prepared("get_chunk", token, chunk_index);
  if (res.empty()) return std::nullopt;

  model::ChunkRecord r;
  r.token          = res[0][0].c_str();
  r.chunk_index    = res[0][1].as<uint32_t>();
  r.digest         = res[0][2].c_str();
  r.received_at_ms = res[0][3].as<uint64_t>();
  return r;
}

std::vector<uint32_t> PgRepository::ListChunkIndices(Transaction& t, const std::string& token) {
  auto res = TX(t).Work().exec_prepared("list_chunk_indices", token);

  std::vector<uint32_t> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(row[0].as<uint32_t>());
  return out;
}

// ------------------------------------------------------------------
// Artifacts
// ------------------------------------------------------------------

Result PgRepository::InsertArtifact(Transaction& t, const model::ArtifactRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_artifact", r.artifact_id, r.owner_id, r.original_filename, r.path,
                               r.size_bytes, r.mime_type, r.session_token, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ArtifactRecord> PgRepository::GetArtifact(Transaction& t, const std::string& artifact_id) {
  auto res = TX(t).Work().exec_prepared("get_artifact", artifact_id);
  if (res.empty()) return std::nullopt;

  model::ArtifactRecord r;
  r.artifact_id       = res[0][0].c_str();
  r.owner_id          = res[0][1].c_str();
  r.original_filename = res[0][2].c_str();
  r.path              = res[0][3].c_str();
  r.size_bytes        = res[0][4].as<uint64_t>();
  r.mime_type         = res[0][5].c_str();
  r.session_token     = res[0][6].c_str();
  r.created_at_ms     = res[0][7].as<uint64_t>();
  return r;
}

} // namespace upload::db::postgres
