#pragma once

#include <cstdint>
#include <string>

namespace upload::notify {

// "upload completed", published once per session.
struct CompletionEvent {
  std::string artifact_id;
  std::string owner_id;
  std::string filename;
  std::string path;
  std::string mime_type;
  uint64_t    size_bytes      = 0;
  uint64_t    completed_at_ms = 0;
};

} // namespace upload::notify
