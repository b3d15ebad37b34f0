#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace upload::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertSession(Transaction&, const model::SessionRecord&) override;
  std::optional<model::SessionRecord> GetSession(Transaction&, const std::string&) override;
  Result UpdateSession(Transaction&, const model::SessionRecord&) override;
  Result DeleteSession(Transaction&, const std::string&) override;
  std::vector<model::SessionRecord> ListSessionsByOwner(Transaction&, const std::string&) override;
  std::vector<model::SessionRecord> ListSessionsByStatus(Transaction&, upload::manager::v1::SessionStatus) override;

  Result InsertChunk(Transaction&, const model::ChunkRecord&) override;
  std::optional<model::ChunkRecord> GetChunk(Transaction&, const std::string&, uint32_t) override;
  std::vector<uint32_t> ListChunkIndices(Transaction&, const std::string&) override;

  Result InsertArtifact(Transaction&, const model::ArtifactRecord&) override;
  std::optional<model::ArtifactRecord> GetArtifact(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  /*
    A session row and its chunk rows share one stamp. Stamps come from a
    single counter, so a deleted and re-created token never repeats one.
  */
  struct SessionEntry {
    model::SessionRecord record;
    std::map<uint32_t, model::ChunkRecord> chunks;
    uint64_t stamp = 0;
  };

  struct ArtifactEntry {
    model::ArtifactRecord record;
    uint64_t stamp = 0;
  };

  std::mutex mutex_;
  std::unordered_map<std::string, SessionEntry> sessions_;
  std::unordered_map<std::string, ArtifactEntry> artifacts_;
  // bumped whenever one of the owner's sessions is written
  std::unordered_map<std::string, uint64_t> owner_stamps_;
  uint64_t clock_ = 0;
};

} // namespace upload::db::memory
