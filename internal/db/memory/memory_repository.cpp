#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace upload::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result MemoryRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  if (TX(t).ReadSession(r.token)) return Result::Err(ErrorCode::AlreadyExists, "session token already exists");
  TX(t).WriteSession(r);
  return Result::Ok();
}

std::optional<model::SessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& token) {
  return TX(t).ReadSession(token);
}

Result MemoryRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
  if (!TX(t).ReadSession(r.token)) return Result::Err(ErrorCode::NotFound, "session not found");
  TX(t).WriteSession(r);
  return Result::Ok();
}

Result MemoryRepository::DeleteSession(Transaction& t, const std::string& token) {
  TX(t).EraseSession(token);
  return Result::Ok();
}

std::vector<model::SessionRecord> MemoryRepository::ListSessionsByOwner(Transaction& t, const std::string& owner_id) {
  return TX(t).ScanSessions([&](const model::SessionRecord& r) { return r.owner_id == owner_id; }, &owner_id);
}

std::vector<model::SessionRecord> MemoryRepository::ListSessionsByStatus(Transaction& t, upload::manager::v1::SessionStatus status) {
  return TX(t).ScanSessions([&](const model::SessionRecord& r) { return r.status == status; });
}

// ------------------------------------------------------------------
// Chunks
// ------------------------------------------------------------------

Result MemoryRepository::InsertChunk(Transaction& t, const model::ChunkRecord& r) {
  if (!TX(t).AddChunk(r)) return Result::Err(ErrorCode::AlreadyExists);
  return Result::Ok();
}

std::optional<model::ChunkRecord> MemoryRepository::GetChunk(Transaction& t, const std::string& token, uint32_t chunk_index) {
  return TX(t).ReadChunk(token, chunk_index);
}

std::vector<uint32_t> MemoryRepository::ListChunkIndices(Transaction& t, const std::string& token) {
  return TX(t).ReadChunkIndices(token);
}

// ------------------------------------------------------------------
// Artifacts
// ------------------------------------------------------------------

Result MemoryRepository::InsertArtifact(Transaction& t, const model::ArtifactRecord& r) {
  if (TX(t).ReadArtifact(r.artifact_id)) return Result::Err(ErrorCode::AlreadyExists);
  TX(t).AddArtifact(r);
  return Result::Ok();
}

std::optional<model::ArtifactRecord> MemoryRepository::GetArtifact(Transaction& t, const std::string& artifact_id) {
  return TX(t).ReadArtifact(artifact_id);
}

} // namespace upload::db::memory
