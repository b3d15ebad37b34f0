#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace upload::db::sqlite {

/*
  Tables (created by the factory at startup):

    upload_sessions(token PK, ..., version)
    upload_session_chunks(token, chunk_index, digest, received_at_ms)
        PRIMARY KEY(token, chunk_index)
    upload_artifacts(artifact_id PK, ...)
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates the tables and indexes if they are missing.
  static void BootstrapSchema(SqliteDB& db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace upload::db::sqlite
