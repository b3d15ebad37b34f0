#include "disk_chunk_buffer.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace upload::storage {

using namespace upload::storage::common;
using db::model::SessionRecord;

namespace {

/*
  fsync(2) on a file or directory.
*/
void SyncPath(const std::filesystem::path& path, bool directory) {
  int flags = O_RDONLY;
  if (directory) flags |= O_DIRECTORY;

  int fd = ::open(path.c_str(), flags);
  if (fd < 0) {
    throw util::StorageError("open " + path.string() + " for fsync: " + std::strerror(errno));
  }
  int rc = ::fsync(fd);
  int saved_errno = errno;
  ::close(fd);
  if (rc != 0) {
    throw util::StorageError("fsync " + path.string() + ": " + std::strerror(saved_errno));
  }
}

void CreateDirectories(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw util::StorageError("create directory " + dir.string() + ": " + ec.message());
  }
}

} // namespace

uint64_t ExpectedChunkLength(const SessionRecord& session, uint32_t chunk_index) {
  if (chunk_index >= session.total_chunks) {
    throw util::InvalidChunkIndex("chunk_index " + std::to_string(chunk_index) + " outside [0, " + std::to_string(session.total_chunks) + ")");
  }
  const uint64_t offset = static_cast<uint64_t>(chunk_index) * session.chunk_size;
  if (chunk_index + 1 == session.total_chunks) {
    return session.file_size - offset;
  }
  return session.chunk_size;
}

DiskChunkBuffer::DiskChunkBuffer(std::filesystem::path staging_root,
                                 std::filesystem::path blob_root,
                                 std::shared_ptr<registry::SessionRegistry> registry,
                                 bool fsync)
    : staging_root_(std::move(staging_root)),
      blob_root_(std::move(blob_root)),
      registry_(std::move(registry)),
      fsync_(fsync) {

  CreateDirectories(staging_root_);
  CreateDirectories(blob_root_);
}

std::filesystem::path DiskChunkBuffer::StagingPathFor(const std::string& token) const {
  return StagingPath(staging_root_, token);
}

std::filesystem::path DiskChunkBuffer::ArtifactPathFor(const SessionRecord& session) const {
  return ArtifactPath(blob_root_, session.owner_id, session.artifact_id, registry::ArtifactExtension(session.filename));
}

/*
  Cached handle, or open the staging file (creating it sparse at full
  size on first use). nullptr once the artifact has been published.
*/
std::shared_ptr<arrow::io::MemoryMappedFile>
DiskChunkBuffer::OpenStaging(const SessionRecord& session) {
  {
    std::lock_guard lock(handles_mutex_);
    auto it = handles_.find(session.token);
    if (it != handles_.end()) return it->second;
  }

  const auto path = StagingPathFor(session.token);

  std::shared_ptr<arrow::io::MemoryMappedFile> file;
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    file = Unwrap(arrow::io::MemoryMappedFile::Open(path.string(), arrow::io::FileMode::READWRITE), "open staging file");
  } else if (std::filesystem::exists(ArtifactPathFor(session), ec)) {
    return nullptr;
  } else {
    file = Unwrap(arrow::io::MemoryMappedFile::Create(path.string(), static_cast<int64_t>(session.file_size)),
                  "create staging file");
  }

  std::lock_guard lock(handles_mutex_);
  return handles_.try_emplace(session.token, std::move(file)).first->second;
}

std::shared_ptr<arrow::io::MemoryMappedFile>
DiskChunkBuffer::ReleaseHandle(const std::string& token) {
  std::lock_guard lock(handles_mutex_);
  auto it = handles_.find(token);
  if (it == handles_.end()) return nullptr;
  auto file = std::move(it->second);
  handles_.erase(it);
  return file;
}

void DiskChunkBuffer::Write(const SessionRecord& session,
                            uint32_t chunk_index,
                            std::string_view data) {

  const auto expected = ExpectedChunkLength(session, chunk_index);
  if (data.size() != expected) {
    throw util::ChunkSizeMismatch("chunk " + std::to_string(chunk_index) + " has " + std::to_string(data.size()) +
                                  " bytes, expected " + std::to_string(expected));
  }

  auto file = OpenStaging(session);
  if (!file) {
    UPLOAD_LOG_DEBUG("chunk for published artifact skipped", {observability::StringField("artifact_id", session.artifact_id),
                                                              observability::IntField("chunk_index", chunk_index)});
    return;
  }
  const auto offset = static_cast<int64_t>(chunk_index) * static_cast<int64_t>(session.chunk_size);
  Unwrap(file->WriteAt(offset, data.data(), static_cast<int64_t>(data.size())), "write chunk");
}

bool DiskChunkBuffer::IsComplete(const std::string& token) {
  const auto session = registry_->Lookup(token);
  return session.received_chunks == session.total_chunks;
}

std::filesystem::path DiskChunkBuffer::Finalize(const SessionRecord& session) {
  const auto final_path   = ArtifactPathFor(session);
  const auto staging_path = StagingPathFor(session.token);

  std::error_code ec;
  if (std::filesystem::exists(final_path, ec)) {
    // published by an earlier call; the catalog write is what is being retried
    Discard(session.token);
    return final_path;
  }
  if (!std::filesystem::exists(staging_path, ec)) {
    throw util::StorageError("staging file missing for artifact " + session.artifact_id);
  }

  if (!IsComplete(session.token)) {
    throw util::Incomplete("not every chunk of artifact " + session.artifact_id + " has arrived");
  }

  if (auto file = ReleaseHandle(session.token)) {
    Unwrap(file->Close(), "close staging file");
  }

  const auto staged_size = std::filesystem::file_size(staging_path, ec);
  if (ec || staged_size != session.file_size) {
    throw util::StorageError("staging file for artifact " + session.artifact_id + " has unexpected size");
  }

  if (fsync_) SyncPath(staging_path, false);

  CreateDirectories(final_path.parent_path());
  std::filesystem::rename(staging_path, final_path, ec);
  if (ec) {
    throw util::StorageError("publish artifact " + final_path.string() + ": " + ec.message());
  }

  if (fsync_) SyncPath(final_path.parent_path(), true);

  UPLOAD_LOG_INFO("artifact published", {observability::StringField("artifact_id", session.artifact_id),
                                         observability::StringField("path", final_path.string())});
  return final_path;
}

void DiskChunkBuffer::Discard(const std::string& token) {
  if (auto file = ReleaseHandle(token)) {
    auto status = file->Close();
    if (!status.ok()) {
      UPLOAD_LOG_WARN("closing staging file failed", {observability::StringField("error", status.ToString())});
    }
  }

  std::error_code ec;
  std::filesystem::remove(StagingPathFor(token), ec);
  if (ec) {
    throw util::StorageError("remove staging file: " + ec.message());
  }
}

} // namespace upload::storage
