#pragma once

#include <cstdint>
#include <string>

namespace upload::db::model {

/*
  Catalog row for a finished upload.

  Written in the same transaction that marks the session completed; the
  analysis side reads it by artifact id.
*/
struct ArtifactRecord {
  std::string artifact_id;
  std::string owner_id;
  std::string original_filename;
  std::string path;
  uint64_t    size_bytes = 0;
  std::string mime_type;
  std::string session_token;
  uint64_t    created_at_ms = 0;
};

} // namespace upload::db::model
