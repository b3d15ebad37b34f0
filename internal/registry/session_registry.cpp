#include "session_registry.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <limits>
#include <unordered_map>

#include "internal/model/session_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace upload::registry {

using namespace upload::manager::v1;
using db::model::SessionRecord;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::Busy:
    case db::ErrorCode::AlreadyExists:
      throw util::Conflict(message);
    default:
      throw util::StorageError(message);
  }
}

SessionRecord RequireSession(db::Repository& repo, db::Transaction& tx, const std::string& token) {
  auto record = repo.GetSession(tx, token);
  if (!record) {
    throw util::NotFound("upload session not found");
  }
  return *record;
}

void Save(db::Repository& repo, db::Transaction& tx, SessionRecord& record, uint64_t now_ms) {
  record.updated_at_ms = now_ms;
  record.version++;
  ThrowIfDbError(repo.UpdateSession(tx, record), "update upload session");
}

// Commits nothing by itself; the caller's transaction carries the write.
bool ExpireIfDue(db::Repository& repo, db::Transaction& tx, SessionRecord& record, uint64_t now_ms) {
  if (record.status != SESSION_STATUS_ACTIVE || now_ms <= record.expires_at_ms) {
    return false;
  }
  record.status = SESSION_STATUS_EXPIRED;
  Save(repo, tx, record, now_ms);
  return true;
}

std::string DescribeTransition(SessionStatus from, SessionStatus to) {
  return "cannot move session from " + std::string(model::StatusName(from)) + " to " + std::string(model::StatusName(to));
}

} // namespace

std::string ArtifactExtension(const std::string& filename) {
  auto ext = std::filesystem::path(filename).extension().string();
  if (ext.size() < 2 || ext.size() > 16) {
    return {};
  }
  for (std::size_t i = 1; i < ext.size(); ++i) {
    const auto c = static_cast<unsigned char>(ext[i]);
    if (!std::isalnum(c)) {
      return {};
    }
    ext[i] = static_cast<char>(std::tolower(c));
  }
  return ext;
}

std::string MimeTypeForFilename(const std::string& filename) {
  static const std::unordered_map<std::string, std::string> kMimeTypes = {
      {".mp4", "video/mp4"},        {".m4v", "video/x-m4v"},      {".mov", "video/quicktime"},
      {".mkv", "video/x-matroska"}, {".webm", "video/webm"},      {".avi", "video/x-msvideo"},
      {".mpeg", "video/mpeg"},      {".mpg", "video/mpeg"},       {".ts", "video/mp2t"},
      {".3gp", "video/3gpp"},       {".flv", "video/x-flv"},      {".wmv", "video/x-ms-wmv"},
  };

  auto it = kMimeTypes.find(ArtifactExtension(filename));
  return it == kMimeTypes.end() ? "application/octet-stream" : it->second;
}

SessionRegistry::SessionRegistry(std::shared_ptr<db::Repository> repository, RegistryOptions options)
    : repository_(std::move(repository)), options_(options) {
  if (!repository_) {
    throw std::invalid_argument("SessionRegistry: repository is required");
  }
}

template <typename Fn>
auto SessionRegistry::RunTransaction(const char* op, Fn&& fn) {
  for (int attempt = 1;; ++attempt) {
    try {
      auto tx     = repository_->Begin();
      auto result = fn(*tx);
      tx->Commit();
      return result;
    } catch (const util::Conflict& e) {
      if (attempt >= kMaxAttempts) {
        UPLOAD_LOG_WARN("registry transaction gave up", {observability::StringField("op", op), observability::IntField("attempts", attempt),
                                                         observability::StringField("error", e.what())});
        throw;
      }
      UPLOAD_LOG_DEBUG("registry transaction conflict, retrying",
                       {observability::StringField("op", op), observability::IntField("attempt", attempt)});
    }
  }
}

// ------------------------------------------------------------------
// Create / read
// ------------------------------------------------------------------

SessionRecord SessionRegistry::Create(const std::string& owner_id, const std::string& filename, uint64_t total_size, uint32_t chunk_size) {
  if (owner_id.empty()) {
    throw util::Unauthorized("missing subject id");
  }
  if (filename.empty()) {
    throw util::InvalidArgument("filename must not be empty");
  }
  if (total_size == 0) {
    throw util::InvalidSize("file_size must be positive");
  }
  if (total_size > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    throw util::InvalidSize("file_size exceeds the largest stageable file");
  }
  if (chunk_size == 0) {
    throw util::InvalidSize("chunk_size must be positive");
  }
  if (chunk_size > options_.max_chunk_size) {
    throw util::InvalidSize("chunk_size exceeds the maximum of " + std::to_string(options_.max_chunk_size) + " bytes");
  }

  const uint64_t total_chunks = total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0);
  if (total_chunks > std::numeric_limits<uint32_t>::max()) {
    throw util::InvalidSize("file_size / chunk_size yields too many chunks");
  }

  auto record = RunTransaction("create", [&](db::Transaction& tx) {
    if (options_.owner_quota_bytes > 0) {
      uint64_t in_flight = 0;
      for (const auto& existing : repository_->ListSessionsByOwner(tx, owner_id)) {
        if (existing.status == SESSION_STATUS_ACTIVE || existing.status == SESSION_STATUS_COMPLETING) {
          in_flight += existing.file_size;
        }
      }
      if (in_flight + total_size > options_.owner_quota_bytes) {
        throw util::QuotaExceeded("owner quota of " + std::to_string(options_.owner_quota_bytes) + " bytes exceeded");
      }
    }

    const auto now = util::NowMillis();

    SessionRecord r;
    r.token           = util::GenerateSessionToken();
    r.owner_id        = owner_id;
    r.filename        = filename;
    r.file_size       = total_size;
    r.chunk_size      = chunk_size;
    r.total_chunks    = static_cast<uint32_t>(total_chunks);
    r.received_chunks = 0;
    r.status          = SESSION_STATUS_ACTIVE;
    r.created_at_ms   = now;
    r.updated_at_ms   = now;
    r.expires_at_ms   = now + static_cast<uint64_t>(options_.ttl.count());
    r.artifact_id     = util::ToString(util::GenerateUUID());
    r.version         = 1;

    ThrowIfDbError(repository_->InsertSession(tx, r), "insert upload session");
    return r;
  });

  observability::Metrics::Instance().RecordSessionTransition(model::StatusName(record.status));
  UPLOAD_LOG_INFO("upload session created",
                  {observability::StringField("artifact_id", record.artifact_id), observability::StringField("owner", owner_id),
                   observability::IntField("file_size", static_cast<int64_t>(total_size)),
                   observability::IntField("total_chunks", record.total_chunks)});
  return record;
}

SessionRecord SessionRegistry::Lookup(const std::string& token) {
  return RunTransaction("lookup", [&](db::Transaction& tx) {
    auto record = RequireSession(*repository_, tx, token);
    ExpireIfDue(*repository_, tx, record, util::NowMillis());
    return record;
  });
}

SessionRecord SessionRegistry::Get(const std::string& token) {
  auto record = Lookup(token);
  if (record.status == SESSION_STATUS_EXPIRED) {
    throw util::Expired("upload session expired");
  }
  return record;
}

std::optional<db::model::ArtifactRecord> SessionRegistry::GetArtifact(const std::string& artifact_id) {
  return RunTransaction("get_artifact", [&](db::Transaction& tx) { return repository_->GetArtifact(tx, artifact_id); });
}

// ------------------------------------------------------------------
// Chunks
// ------------------------------------------------------------------

SessionRecord SessionRegistry::VerifyChunk(const std::string& token, uint32_t chunk_index, const std::string& digest) {
  auto [record, existing] = RunTransaction("verify_chunk", [&](db::Transaction& tx) {
    auto session = RequireSession(*repository_, tx, token);
    ExpireIfDue(*repository_, tx, session, util::NowMillis());
    std::optional<db::model::ChunkRecord> chunk;
    if (!digest.empty() && chunk_index < session.total_chunks) {
      chunk = repository_->GetChunk(tx, token, chunk_index);
    }
    return std::make_pair(std::move(session), std::move(chunk));
  });

  if (record.status == SESSION_STATUS_EXPIRED) {
    throw util::Expired("upload session expired");
  }
  if (record.status != SESSION_STATUS_ACTIVE) {
    throw util::SessionNotActive("upload session is " + std::string(model::StatusName(record.status)));
  }
  if (chunk_index >= record.total_chunks) {
    throw util::InvalidChunkIndex("chunk_index " + std::to_string(chunk_index) + " outside [0, " + std::to_string(record.total_chunks) + ")");
  }
  if (existing && !existing->digest.empty() && existing->digest != digest) {
    throw util::ChunkDigestMismatch("chunk " + std::to_string(chunk_index) + " was already received with a different digest");
  }
  return record;
}

ChunkReceipt SessionRegistry::RecordChunk(const std::string& token, uint32_t chunk_index, const std::string& digest) {
  auto receipt = RunTransaction("record_chunk", [&](db::Transaction& tx) -> std::optional<ChunkReceipt> {
    const auto now    = util::NowMillis();
    auto       record = RequireSession(*repository_, tx, token);

    if (ExpireIfDue(*repository_, tx, record, now)) {
      return std::nullopt;
    }
    if (record.status != SESSION_STATUS_ACTIVE) {
      throw util::SessionNotActive("upload session is " + std::string(model::StatusName(record.status)));
    }
    if (chunk_index >= record.total_chunks) {
      throw util::InvalidChunkIndex("chunk_index " + std::to_string(chunk_index) + " outside [0, " + std::to_string(record.total_chunks) + ")");
    }

    if (auto existing = repository_->GetChunk(tx, token, chunk_index)) {
      if (!existing->digest.empty() && !digest.empty() && existing->digest != digest) {
        throw util::ChunkDigestMismatch("chunk " + std::to_string(chunk_index) + " was already received with a different digest");
      }
      return ChunkReceipt{record.received_chunks, record.total_chunks, false};
    }

    db::model::ChunkRecord chunk;
    chunk.token          = token;
    chunk.chunk_index    = chunk_index;
    chunk.digest         = digest;
    chunk.received_at_ms = now;
    ThrowIfDbError(repository_->InsertChunk(tx, chunk), "insert chunk");

    record.received_chunks++;
    Save(*repository_, tx, record, now);
    return ChunkReceipt{record.received_chunks, record.total_chunks, true};
  });

  if (!receipt) {
    throw util::Expired("upload session expired");
  }
  return *receipt;
}

std::vector<uint32_t> SessionRegistry::MissingChunks(const std::string& token) {
  return RunTransaction("missing_chunks", [&](db::Transaction& tx) {
    const auto record  = RequireSession(*repository_, tx, token);
    const auto arrived = repository_->ListChunkIndices(tx, token);

    std::vector<uint32_t> missing;
    missing.reserve(record.total_chunks - std::min<std::size_t>(arrived.size(), record.total_chunks));
    auto it = arrived.begin();
    for (uint32_t index = 0; index < record.total_chunks; ++index) {
      if (it != arrived.end() && *it == index) {
        ++it;
        continue;
      }
      missing.push_back(index);
    }
    return missing;
  });
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

SessionRecord SessionRegistry::Transition(const std::string& token, SessionStatus to, const std::string& artifact_path) {
  auto updated = RunTransaction("transition", [&](db::Transaction& tx) {
    const auto now    = util::NowMillis();
    auto       record = RequireSession(*repository_, tx, token);

    if (!model::CanTransition(record.status, to)) {
      throw util::IllegalTransition(DescribeTransition(record.status, to));
    }

    if (to == SESSION_STATUS_COMPLETED) {
      record.notified = false;
      if (artifact_path.empty()) {
        throw util::InvalidArgument("completed sessions need an artifact path");
      }
      if (record.received_chunks != record.total_chunks) {
        throw util::Incomplete("session has " + std::to_string(record.received_chunks) + " of " + std::to_string(record.total_chunks) + " chunks");
      }

      record.artifact_path   = artifact_path;
      record.completed_at_ms = now;

      db::model::ArtifactRecord artifact;
      artifact.artifact_id       = record.artifact_id;
      artifact.owner_id          = record.owner_id;
      artifact.original_filename = record.filename;
      artifact.path              = artifact_path;
      artifact.size_bytes        = record.file_size;
      artifact.mime_type         = MimeTypeForFilename(record.filename);
      artifact.session_token     = record.token;
      artifact.created_at_ms     = now;
      ThrowIfDbError(repository_->InsertArtifact(tx, artifact), "insert artifact");
    }

    record.status = to;
    Save(*repository_, tx, record, now);
    return record;
  });

  observability::Metrics::Instance().RecordSessionTransition(model::StatusName(to));
  UPLOAD_LOG_INFO("upload session transition",
                  {observability::StringField("artifact_id", updated.artifact_id), observability::StringField("status", model::StatusName(to))});
  return updated;
}

bool SessionRegistry::MarkNotified(const std::string& token) {
  return RunTransaction("mark_notified", [&](db::Transaction& tx) {
    auto record = RequireSession(*repository_, tx, token);
    if (record.notified) {
      return false;
    }
    record.notified = true;
    Save(*repository_, tx, record, util::NowMillis());
    return true;
  });
}

std::vector<SessionRecord> SessionRegistry::PendingCompletions() {
  return RunTransaction("pending_completions", [&](db::Transaction& tx) {
    auto completed = repository_->ListSessionsByStatus(tx, SESSION_STATUS_COMPLETED);
    completed.erase(std::remove_if(completed.begin(), completed.end(), [](const SessionRecord& r) { return r.notified; }), completed.end());
    return completed;
  });
}

uint32_t SessionRegistry::RecordFinalizeFailure(const std::string& token) {
  return RunTransaction("record_finalize_failure", [&](db::Transaction& tx) {
    auto record = RequireSession(*repository_, tx, token);
    record.finalize_failures++;
    Save(*repository_, tx, record, util::NowMillis());
    return record.finalize_failures;
  });
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

std::vector<std::string> SessionRegistry::SweepExpired() {
  auto swept = RunTransaction("sweep_expired", [&](db::Transaction& tx) {
    const auto               now = util::NowMillis();
    std::vector<std::string> tokens;
    for (auto& record : repository_->ListSessionsByStatus(tx, SESSION_STATUS_ACTIVE)) {
      if (ExpireIfDue(*repository_, tx, record, now)) {
        tokens.push_back(record.token);
      }
    }
    return tokens;
  });

  for (std::size_t i = 0; i < swept.size(); ++i) {
    observability::Metrics::Instance().RecordSessionTransition(model::StatusName(SESSION_STATUS_EXPIRED));
  }
  return swept;
}

std::vector<SessionRecord> SessionRegistry::PurgeTerminal(std::chrono::milliseconds retention) {
  return RunTransaction("purge_terminal", [&](db::Transaction& tx) {
    const auto now = util::NowMillis();

    std::vector<SessionRecord> purged;
    for (auto status : {SESSION_STATUS_COMPLETED, SESSION_STATUS_CANCELLED, SESSION_STATUS_EXPIRED}) {
      for (auto& record : repository_->ListSessionsByStatus(tx, status)) {
        const auto last_change = record.completed_at_ms != 0 ? record.completed_at_ms : record.updated_at_ms;
        if (now < last_change + static_cast<uint64_t>(retention.count())) {
          continue;
        }
        ThrowIfDbError(repository_->DeleteSession(tx, record.token), "delete upload session");
        purged.push_back(std::move(record));
      }
    }
    return purged;
  });
}

std::size_t SessionRegistry::RecoverInFlight() {
  return RunTransaction("recover_in_flight", [&](db::Transaction& tx) {
    const auto  now       = util::NowMillis();
    std::size_t recovered = 0;
    for (auto& record : repository_->ListSessionsByStatus(tx, SESSION_STATUS_COMPLETING)) {
      record.status = SESSION_STATUS_ACTIVE;
      Save(*repository_, tx, record, now);
      ++recovered;
    }
    return recovered;
  });
}

} // namespace upload::registry
