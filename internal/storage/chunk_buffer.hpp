#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "internal/db/model/session_record.hpp"

namespace upload::storage {

/*
  Staging area for one upload at a time.

  Every chunk lands at offset chunk_index * chunk_size of a staging file
  sized to the declared file size, so writes are idempotent and arrival
  order does not matter. The buffer keeps no arrival state of its own;
  completeness comes from the session registry.

  Implementations:
    DiskChunkBuffer → Arrow memory-mapped staging file + rename into blob root
*/

class ChunkBuffer {
 public:
  virtual ~ChunkBuffer() = default;

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  /*
    ChunkSizeMismatch unless data is exactly the expected length for the
    index (chunk_size, or the remainder for the last index).
    Once the session's artifact is published the bytes are already in
    place and the write is a no-op; no new staging file is created.
  */
  virtual void Write(const db::model::SessionRecord& session, uint32_t chunk_index, std::string_view data) = 0;

  // ------------------------------------------------------------------
  // Completion
  // ------------------------------------------------------------------
  virtual bool IsComplete(const std::string& token) = 0;

  // ------------------------------------------------------------------
  // Finalize
  // ------------------------------------------------------------------
  /*
    Incomplete unless every chunk has arrived. Flushes the staging file,
    renames it to its artifact path and returns that path. Once the
    artifact exists every later call returns its path without touching
    storage, and any leftover staging file for the token is removed.
  */
  virtual std::filesystem::path Finalize(const db::model::SessionRecord& session) = 0;

  // ------------------------------------------------------------------
  // Discard
  // ------------------------------------------------------------------
  // Removes the staging file; a missing file is not an error.
  virtual void Discard(const std::string& token) = 0;

  virtual std::filesystem::path ArtifactPathFor(const db::model::SessionRecord& session) const = 0;
};

using ChunkBufferPtr = std::shared_ptr<ChunkBuffer>;

// Expected byte length of chunk_index; InvalidChunkIndex when out of range.
uint64_t ExpectedChunkLength(const db::model::SessionRecord& session, uint32_t chunk_index);

} // namespace upload::storage
