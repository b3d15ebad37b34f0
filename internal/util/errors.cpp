#include "errors.hpp"

namespace upload::util {

const char* ErrorCode(const std::exception& e) {
  if (dynamic_cast<const NotFound*>(&e)) return "not_found";
  if (dynamic_cast<const Expired*>(&e)) return "expired";
  if (dynamic_cast<const SessionNotActive*>(&e)) return "session_not_active";
  if (dynamic_cast<const IllegalTransition*>(&e)) return "illegal_transition";
  if (dynamic_cast<const InvalidSize*>(&e)) return "invalid_size";
  if (dynamic_cast<const InvalidChunkIndex*>(&e)) return "invalid_chunk_index";
  if (dynamic_cast<const ChunkSizeMismatch*>(&e)) return "chunk_size_mismatch";
  if (dynamic_cast<const ChunkDigestMismatch*>(&e)) return "chunk_digest_mismatch";
  if (dynamic_cast<const UnknownMessageKind*>(&e)) return "unknown_message_kind";
  if (dynamic_cast<const MalformedFrame*>(&e)) return "malformed_frame";
  if (dynamic_cast<const InvalidArgument*>(&e)) return "invalid_argument";
  if (dynamic_cast<const Incomplete*>(&e)) return "incomplete";
  if (dynamic_cast<const QuotaExceeded*>(&e)) return "quota_exceeded";
  if (dynamic_cast<const Unauthorized*>(&e)) return "unauthorized";
  if (dynamic_cast<const Conflict*>(&e)) return "conflict";
  if (dynamic_cast<const StorageError*>(&e)) return "storage_error";
  return "internal";
}

} // namespace upload::util
