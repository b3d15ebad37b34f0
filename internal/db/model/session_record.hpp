#pragma once

#include <cstdint>
#include <string>

#include "upload/manager/v1/types.pb.h"

namespace upload::db::model {

/*
  Persistent upload session row.

  IMPORTANT:
  - This is the authoritative state machine record.
  - received_chunks always equals the number of chunk rows for the token.
  - version increments on every update and fences concurrent writers.
*/

struct SessionRecord {
  std::string token;
  std::string owner_id;
  std::string filename;

  uint64_t file_size       = 0;
  uint32_t chunk_size      = 0;
  uint32_t total_chunks    = 0;
  uint32_t received_chunks = 0;

  upload::manager::v1::SessionStatus status = upload::manager::v1::SESSION_STATUS_UNSPECIFIED;

  uint64_t created_at_ms   = 0;
  uint64_t expires_at_ms   = 0;
  uint64_t completed_at_ms = 0; // 0 = not completed
  uint64_t updated_at_ms   = 0;

  std::string artifact_id;
  std::string artifact_path;

  // Completion event already emitted.
  bool notified = false;

  uint32_t finalize_failures = 0;

  uint64_t version = 0;
};

} // namespace upload::db::model
