#include "memory_tx.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace upload::db::memory {

namespace {

uint64_t StampOf(const std::unordered_map<std::string, uint64_t>& stamps, const std::string& key) {
  auto it = stamps.find(key);
  return it == stamps.end() ? 0 : it->second;
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryTransaction::TokenView& MemoryTransaction::Touch(const std::string& token) {
  if (auto it = tokens_.find(token); it != tokens_.end()) return it->second;
  std::scoped_lock lock(repo_.mutex_);
  return TouchLocked(token);
}

MemoryTransaction::TokenView& MemoryTransaction::TouchLocked(const std::string& token) {
  auto [it, inserted] = tokens_.try_emplace(token);
  if (inserted) {
    auto entry = repo_.sessions_.find(token);
    if (entry != repo_.sessions_.end()) {
      it->second.stamp   = entry->second.stamp;
      it->second.session = entry->second.record;
    }
  }
  return it->second;
}

const MemoryRepository::SessionEntry& MemoryTransaction::CommittedLocked(const std::string& token, const TokenView& view) const {
  auto it = repo_.sessions_.find(token);
  if (it == repo_.sessions_.end() || it->second.stamp != view.stamp) {
    throw upload::util::Conflict("transaction conflict: upload session modified by a concurrent transaction");
  }
  return it->second;
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

std::optional<model::SessionRecord> MemoryTransaction::ReadSession(const std::string& token) {
  auto& view   = Touch(token);
  view.depends = true;
  return view.session;
}

void MemoryTransaction::WriteSession(const model::SessionRecord& record) {
  auto& view   = Touch(record.token);
  view.session = record;
  view.depends = true;
  view.written = true;
  dirty_       = true;
}

void MemoryTransaction::EraseSession(const std::string& token) {
  auto& view          = Touch(token);
  view.session.reset();
  view.added_chunks.clear();
  view.chunks_dropped = true;
  view.depends        = true;
  view.written        = true;
  dirty_              = true;
}

std::vector<model::SessionRecord> MemoryTransaction::ScanSessions(const std::function<bool(const model::SessionRecord&)>& match,
                                                                  const std::string* owner) {
  std::scoped_lock lock(repo_.mutex_);
  if (owner != nullptr) {
    owner_reads_.try_emplace(*owner, StampOf(repo_.owner_stamps_, *owner));
  }
  for (const auto& [token, entry] : repo_.sessions_) {
    if (match(entry.record)) TouchLocked(token);
  }

  std::vector<model::SessionRecord> out;
  for (const auto& [_, view] : tokens_) {
    if (view.session && match(*view.session)) out.push_back(*view.session);
  }
  return out;
}

// ------------------------------------------------------------------
// Chunks
// ------------------------------------------------------------------

std::optional<model::ChunkRecord> MemoryTransaction::ReadChunk(const std::string& token, uint32_t chunk_index) {
  auto& view   = Touch(token);
  view.depends = true;
  if (auto it = view.added_chunks.find(chunk_index); it != view.added_chunks.end()) return it->second;
  if (view.chunks_dropped || view.stamp == 0) return std::nullopt;

  std::scoped_lock lock(repo_.mutex_);
  const auto& entry = CommittedLocked(token, view);
  auto        it    = entry.chunks.find(chunk_index);
  if (it == entry.chunks.end()) return std::nullopt;
  return it->second;
}

std::vector<uint32_t> MemoryTransaction::ReadChunkIndices(const std::string& token) {
  auto& view   = Touch(token);
  view.depends = true;

  std::vector<uint32_t> out;
  if (!view.chunks_dropped && view.stamp != 0) {
    std::scoped_lock lock(repo_.mutex_);
    const auto& entry = CommittedLocked(token, view);
    out.reserve(entry.chunks.size() + view.added_chunks.size());
    for (const auto& [index, _] : entry.chunks) out.push_back(index);
  }
  for (const auto& [index, _] : view.added_chunks) out.push_back(index);
  std::sort(out.begin(), out.end());
  return out;
}

bool MemoryTransaction::AddChunk(const model::ChunkRecord& record) {
  if (ReadChunk(record.token, record.chunk_index)) return false;
  auto& view = tokens_.at(record.token);
  view.added_chunks.emplace(record.chunk_index, record);
  view.written = true;
  dirty_       = true;
  return true;
}

// ------------------------------------------------------------------
// Artifacts
// ------------------------------------------------------------------

std::optional<model::ArtifactRecord> MemoryTransaction::ReadArtifact(const std::string& artifact_id) {
  if (auto it = added_artifacts_.find(artifact_id); it != added_artifacts_.end()) return it->second;

  std::scoped_lock lock(repo_.mutex_);
  auto it = repo_.artifacts_.find(artifact_id);
  artifact_reads_.try_emplace(artifact_id, it == repo_.artifacts_.end() ? 0 : it->second.stamp);
  if (it == repo_.artifacts_.end()) return std::nullopt;
  return it->second.record;
}

void MemoryTransaction::AddArtifact(const model::ArtifactRecord& record) {
  added_artifacts_[record.artifact_id] = record;
  dirty_                               = true;
}

// ------------------------------------------------------------------
// Commit / rollback
// ------------------------------------------------------------------

void MemoryTransaction::Commit() {
  committed_ = true;
  // read-only transactions never conflict
  if (!dirty_) return;

  std::scoped_lock lock(repo_.mutex_);

  for (const auto& [token, view] : tokens_) {
    if (!view.depends && !view.written) continue;
    auto           it      = repo_.sessions_.find(token);
    const uint64_t current = it == repo_.sessions_.end() ? 0 : it->second.stamp;
    if (current != view.stamp) {
      throw upload::util::Conflict("transaction conflict: upload session modified by a concurrent transaction");
    }
  }
  for (const auto& [owner, seen] : owner_reads_) {
    if (StampOf(repo_.owner_stamps_, owner) != seen) {
      throw upload::util::Conflict("transaction conflict: owner sessions modified by a concurrent transaction");
    }
  }
  for (const auto& [artifact_id, seen] : artifact_reads_) {
    auto it = repo_.artifacts_.find(artifact_id);
    if ((it == repo_.artifacts_.end() ? 0 : it->second.stamp) != seen) {
      throw upload::util::Conflict("transaction conflict: artifact catalog modified by a concurrent transaction");
    }
  }

  for (auto& [token, view] : tokens_) {
    if (!view.written) continue;
    const auto stamp = ++repo_.clock_;
    auto       it    = repo_.sessions_.find(token);

    if (!view.session) {
      if (it != repo_.sessions_.end()) {
        repo_.owner_stamps_[it->second.record.owner_id] = stamp;
        repo_.sessions_.erase(it);
      }
      continue;
    }

    auto& entry = it != repo_.sessions_.end() ? it->second : repo_.sessions_[token];
    if (view.chunks_dropped) entry.chunks.clear();
    entry.chunks.merge(view.added_chunks);
    entry.record = std::move(*view.session);
    entry.stamp  = stamp;
    repo_.owner_stamps_[entry.record.owner_id] = stamp;
  }

  for (auto& [artifact_id, record] : added_artifacts_) {
    auto& entry  = repo_.artifacts_[artifact_id];
    entry.record = std::move(record);
    entry.stamp  = ++repo_.clock_;
  }
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace upload::db::memory
