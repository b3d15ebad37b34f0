#pragma once

#include <arrow/io/file.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "internal/registry/session_registry.hpp"
#include "internal/storage/chunk_buffer.hpp"

namespace upload::storage {

/*
  Disk staging using Arrow IO.

  Layout:
    <staging_root>/<token>.part                  sparse, sized to file_size
    <blob_root>/<owner>/<artifact_id><ext>       after finalize

  Properties:
    - offset-addressed writes through a memory-mapped staging file
    - fsync of file + destination directory around the rename (optional)
    - open staging handles are cached per token until finalize/discard
*/

class DiskChunkBuffer final : public ChunkBuffer {
public:
  DiskChunkBuffer(std::filesystem::path staging_root,
                  std::filesystem::path blob_root,
                  std::shared_ptr<registry::SessionRegistry> registry,
                  bool fsync);

  void Write(const db::model::SessionRecord& session,
             uint32_t chunk_index,
             std::string_view data) override;

  bool IsComplete(const std::string& token) override;

  std::filesystem::path Finalize(const db::model::SessionRecord& session) override;

  void Discard(const std::string& token) override;

  std::filesystem::path ArtifactPathFor(const db::model::SessionRecord& session) const override;

  std::filesystem::path StagingPathFor(const std::string& token) const;

private:
  std::shared_ptr<arrow::io::MemoryMappedFile> OpenStaging(const db::model::SessionRecord& session);
  std::shared_ptr<arrow::io::MemoryMappedFile> ReleaseHandle(const std::string& token);

  std::filesystem::path staging_root_;
  std::filesystem::path blob_root_;
  std::shared_ptr<registry::SessionRegistry> registry_;
  bool fsync_;

  // guards the map only; file IO happens outside it
  std::mutex handles_mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::io::MemoryMappedFile>> handles_;
};

} // namespace upload::storage
