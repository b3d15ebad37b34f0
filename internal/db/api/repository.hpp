#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/artifact_record.hpp"
#include "internal/db/model/chunk_record.hpp"
#include "internal/db/model/session_record.hpp"

namespace upload::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A transaction that lost a race with a concurrent writer fails its
    Commit() with util::Conflict and must be retried from the start
  - Chunk rows are unique per (token, chunk_index)

  The DB is the source of truth for:
    session status and counters
    chunk arrival
    the finished-artifact catalog
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Sessions
  // ---------------------------------------------------------------------

  virtual Result InsertSession(Transaction&, const model::SessionRecord&) = 0;

  virtual std::optional<model::SessionRecord> GetSession(Transaction&, const std::string& token) = 0;

  virtual Result UpdateSession(Transaction&, const model::SessionRecord&) = 0;

  // Removes the session and its chunk rows.
  virtual Result DeleteSession(Transaction&, const std::string& token) = 0;

  virtual std::vector<model::SessionRecord> ListSessionsByOwner(Transaction&, const std::string& owner_id) = 0;

  virtual std::vector<model::SessionRecord> ListSessionsByStatus(Transaction&, upload::manager::v1::SessionStatus status) = 0;

  // ---------------------------------------------------------------------
  // Chunks
  // ---------------------------------------------------------------------

  // AlreadyExists when the index was recorded before.
  virtual Result InsertChunk(Transaction&, const model::ChunkRecord&) = 0;

  virtual std::optional<model::ChunkRecord> GetChunk(Transaction&, const std::string& token, uint32_t chunk_index) = 0;

  // Ascending order.
  virtual std::vector<uint32_t> ListChunkIndices(Transaction&, const std::string& token) = 0;

  // ---------------------------------------------------------------------
  // Artifact catalog
  // ---------------------------------------------------------------------

  virtual Result InsertArtifact(Transaction&, const model::ArtifactRecord&) = 0;

  virtual std::optional<model::ArtifactRecord> GetArtifact(Transaction&, const std::string& artifact_id) = 0;
};

} // namespace upload::db
