#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/artifact_record.hpp"
#include "internal/db/model/session_record.hpp"
#include "upload/manager/v1/types.pb.h"

namespace upload::registry {

struct RegistryOptions {
  std::chrono::milliseconds ttl{std::chrono::hours(24)};
  uint32_t                  max_chunk_size = 16 * 1024 * 1024;
  // 0 = unlimited
  uint64_t owner_quota_bytes = 0;
};

struct ChunkReceipt {
  uint32_t received_chunks = 0;
  uint32_t total_chunks    = 0;
  bool     newly_recorded  = false;
};

/*
  Durable session bookkeeping.

  Every operation is one repository transaction, re-run from the start
  when the backend reports a conflicting writer (up to kMaxAttempts).
  Repository results are converted into util:: exceptions here; nothing
  above this layer sees db::Result.

  Expiry is checked lazily: any read of an active session past expires_at
  commits the expired status before answering.
*/
class SessionRegistry {
 public:
  static constexpr int kMaxAttempts = 8;

  SessionRegistry(std::shared_ptr<db::Repository> repository, RegistryOptions options);

  // InvalidSize / InvalidArgument / QuotaExceeded
  db::model::SessionRecord Create(const std::string& owner_id, const std::string& filename, uint64_t total_size, uint32_t chunk_size);

  // NotFound, or Expired when the session is (or just became) expired.
  db::model::SessionRecord Get(const std::string& token);

  // Like Get, but an expired session is returned instead of raised.
  db::model::SessionRecord Lookup(const std::string& token);

  // Pre-check run before bytes reach the staging file:
  // NotFound / Expired / SessionNotActive / InvalidChunkIndex / ChunkDigestMismatch.
  // Returns the session as it stands.
  db::model::SessionRecord VerifyChunk(const std::string& token, uint32_t chunk_index, const std::string& digest);

  // First arrival of an index bumps received_chunks; repeats are no-ops.
  ChunkReceipt RecordChunk(const std::string& token, uint32_t chunk_index, const std::string& digest);

  std::vector<uint32_t> MissingChunks(const std::string& token);

  // Enforces model::CanTransition. A transition to completed stores
  // artifact_path and completed_at and inserts the catalog row.
  db::model::SessionRecord Transition(const std::string& token, upload::manager::v1::SessionStatus to,
                                      const std::string& artifact_path = {});

  // true only for the call that flipped the flag
  bool MarkNotified(const std::string& token);

  // Completed sessions whose completion event has not gone out yet. The
  // transition to completed leaves notified unset in the same write, so a
  // lost MarkNotified shows up here.
  std::vector<db::model::SessionRecord> PendingCompletions();

  // Returns the failure count after the increment.
  uint32_t RecordFinalizeFailure(const std::string& token);

  // Active sessions past expiry -> expired. Returns the swept tokens.
  std::vector<std::string> SweepExpired();

  // Removes terminal sessions whose last change is older than retention.
  std::vector<db::model::SessionRecord> PurgeTerminal(std::chrono::milliseconds retention);

  // completing -> active for every session left mid-finalize by a crash.
  std::size_t RecoverInFlight();

  std::optional<db::model::ArtifactRecord> GetArtifact(const std::string& artifact_id);

  const RegistryOptions& options() const {
    return options_;
  }

 private:
  template <typename Fn>
  auto RunTransaction(const char* op, Fn&& fn);

  std::shared_ptr<db::Repository> repository_;
  RegistryOptions                 options_;
};

// Lowercased extension including the dot, or "" when the name has none
// or it is not plain alphanumeric.
std::string ArtifactExtension(const std::string& filename);

std::string MimeTypeForFilename(const std::string& filename);

} // namespace upload::registry
