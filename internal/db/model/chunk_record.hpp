#pragma once

#include <cstdint>
#include <string>

namespace upload::db::model {

// One arrived chunk. Presence of the row is the arrival flag.
struct ChunkRecord {
  std::string token;
  uint32_t    chunk_index = 0;
  std::string digest;
  uint64_t    received_at_ms = 0;
};

} // namespace upload::db::model
