#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace upload::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

} // namespace upload::db::postgres
