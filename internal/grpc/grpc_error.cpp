#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace upload::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace upload::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const Expired*>(&e) || dynamic_cast<const SessionNotActive*>(&e) || dynamic_cast<const IllegalTransition*>(&e) ||
      dynamic_cast<const Incomplete*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  // InvalidSize, InvalidChunkIndex, ChunkSizeMismatch, ChunkDigestMismatch,
  // UnknownMessageKind and MalformedFrame all derive from InvalidArgument
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const QuotaExceeded*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const Unauthorized*>(&e)) {
    return {::grpc::StatusCode::UNAUTHENTICATED, e.what()};
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const StorageError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace upload::grpc
