#pragma once

#include <stdexcept>
#include <string>

namespace upload::util {

/*
  Central error types.

  Raised by the core; translated later to error frames on the duplex channel
  and to gRPC status codes on the request/response surface.
*/

// Lifecycle errors

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Expired : public std::runtime_error {
 public:
  explicit Expired(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SessionNotActive : public std::runtime_error {
 public:
  explicit SessionNotActive(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IllegalTransition : public std::runtime_error {
 public:
  explicit IllegalTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Client errors

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidSize : public InvalidArgument {
 public:
  explicit InvalidSize(const std::string& msg) : InvalidArgument(msg) {
  }
};

class InvalidChunkIndex : public InvalidArgument {
 public:
  explicit InvalidChunkIndex(const std::string& msg) : InvalidArgument(msg) {
  }
};

class ChunkSizeMismatch : public InvalidArgument {
 public:
  explicit ChunkSizeMismatch(const std::string& msg) : InvalidArgument(msg) {
  }
};

class ChunkDigestMismatch : public InvalidArgument {
 public:
  explicit ChunkDigestMismatch(const std::string& msg) : InvalidArgument(msg) {
  }
};

class UnknownMessageKind : public InvalidArgument {
 public:
  explicit UnknownMessageKind(const std::string& msg) : InvalidArgument(msg) {
  }
};

// Envelope that could not be decoded at all.
class MalformedFrame : public InvalidArgument {
 public:
  explicit MalformedFrame(const std::string& msg) : InvalidArgument(msg) {
  }
};

class Incomplete : public std::runtime_error {
 public:
  explicit Incomplete(const std::string& msg) : std::runtime_error(msg) {
  }
};

class QuotaExceeded : public std::runtime_error {
 public:
  explicit QuotaExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unauthorized : public std::runtime_error {
 public:
  explicit Unauthorized(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Resource errors

class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Stable short code used in error frames ("not_found", "expired", ...).
*/
const char* ErrorCode(const std::exception& e);

} // namespace upload::util
