#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace upload::db::memory {

/*
  Transaction = per-token views + write set

  A token is copied in on first touch (the session row only; chunk rows
  are read through on demand). Commit validates the stamp of every token,
  owner and artifact the transaction depended on and throws util::Conflict
  when one moved; transactions over different sessions never conflict.
  Reading a chunk row of a token that changed since it was touched throws
  util::Conflict right away.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override {
    return committed_ || rolled_back_;
  }

  std::optional<model::SessionRecord> ReadSession(const std::string& token);
  void WriteSession(const model::SessionRecord& record);
  void EraseSession(const std::string& token);

  // Sessions matching the predicate as this transaction sees them.
  // When owner is set, a later session write by that owner fails Commit().
  std::vector<model::SessionRecord> ScanSessions(const std::function<bool(const model::SessionRecord&)>& match,
                                                 const std::string* owner = nullptr);

  std::optional<model::ChunkRecord> ReadChunk(const std::string& token, uint32_t chunk_index);
  std::vector<uint32_t> ReadChunkIndices(const std::string& token);
  // false when the row exists
  bool AddChunk(const model::ChunkRecord& record);

  std::optional<model::ArtifactRecord> ReadArtifact(const std::string& artifact_id);
  void AddArtifact(const model::ArtifactRecord& record);

 private:
  struct TokenView {
    uint64_t stamp = 0; // 0 = absent when touched
    std::optional<model::SessionRecord> session;
    std::map<uint32_t, model::ChunkRecord> added_chunks;
    bool chunks_dropped = false;
    bool depends        = false;
    bool written        = false;
  };

  TokenView& Touch(const std::string& token);
  // caller holds repo_.mutex_
  TokenView& TouchLocked(const std::string& token);
  // caller holds repo_.mutex_
  const MemoryRepository::SessionEntry& CommittedLocked(const std::string& token, const TokenView& view) const;

  MemoryRepository& repo_;

  std::unordered_map<std::string, TokenView> tokens_;
  std::unordered_map<std::string, uint64_t> owner_reads_;
  std::unordered_map<std::string, uint64_t> artifact_reads_;
  std::unordered_map<std::string, model::ArtifactRecord> added_artifacts_;

  bool dirty_       = false;
  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace upload::db::memory
