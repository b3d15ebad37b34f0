#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/model/session_record.hpp"
#include "internal/notify/completion_queue.hpp"
#include "internal/registry/session_registry.hpp"
#include "internal/storage/chunk_buffer.hpp"
#include "upload/manager/v1/channel.pb.h"

namespace upload::session {

struct StateMachineOptions {
  // finalize failures after which error frames are tagged fatal
  uint32_t max_finalize_attempts = 2;
};

/*
  Drives one upload session.

  All durable state lives in the registry; the object itself only owns the
  mutex that serializes message handling for its token. Every public entry
  point takes that mutex for its full duration, so chunk writes, the
  completion check and finalize never interleave for one session.

  Handle() never throws: failures come back as error frames.
*/
class UploadStateMachine {
 public:
  UploadStateMachine(std::string token, std::shared_ptr<registry::SessionRegistry> registry, storage::ChunkBufferPtr buffer,
                     std::shared_ptr<notify::CompletionQueue> completions, StateMachineOptions options = {});

  std::vector<upload::manager::v1::ServerFrame> Handle(const upload::manager::v1::ClientFrame& frame);

  // session_info for a new binding.
  // NotFound / Expired / SessionNotActive when the session cannot take chunks.
  upload::manager::v1::ServerFrame Describe();

  // Lookup with lazy expiry; an expired session has its staging removed.
  db::model::SessionRecord Lookup();

  // Out-of-band cancel. Already cancelled or expired sessions are returned
  // unchanged; a completed session is SessionNotActive.
  db::model::SessionRecord Cancel();

  // Publishes the completion event of a completed session whose
  // notified flag was never stored. true when this call published it.
  bool PublishPendingCompletion();

  // Called after the sweep expired this session.
  void OnExpired();

  // Removes leftover staging for a purged session.
  void OnPurged();

  const std::string& token() const {
    return token_;
  }

 private:
  std::vector<upload::manager::v1::ServerFrame> HandleChunk(const upload::manager::v1::ClientFrame& frame);
  std::vector<upload::manager::v1::ServerFrame> HandleCancel();

  void TryFinalize(std::vector<upload::manager::v1::ServerFrame>& out);
  void NotifyCompletion(const db::model::SessionRecord& session, std::vector<upload::manager::v1::ServerFrame>& out);
  void DiscardStaging(const char* reason);

  std::string                                token_;
  std::shared_ptr<registry::SessionRegistry> registry_;
  storage::ChunkBufferPtr                    buffer_;
  std::shared_ptr<notify::CompletionQueue>   completions_;
  StateMachineOptions                        options_;

  std::mutex mutex_;
};

} // namespace upload::session
