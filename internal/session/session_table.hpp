#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "upload_state_machine.hpp"

namespace upload::session {

/*
  token -> state machine.

  Entries are weak: a machine lives as long as some binding or request
  holds it, and a fresh one is built on the next Acquire() after that.
  Two callers asking for the same token concurrently always share one
  machine (and so one mutex). The table mutex is never held while a
  machine does work.
*/
class SessionTable {
 public:
  SessionTable(std::shared_ptr<registry::SessionRegistry> registry, storage::ChunkBufferPtr buffer,
               std::shared_ptr<notify::CompletionQueue> completions, StateMachineOptions options = {});

  std::shared_ptr<UploadStateMachine> Acquire(const std::string& token);

  // Registry sweep, then staging discard under each session's mutex.
  std::size_t SweepExpired();

  // Retention purge; leftover staging files are removed too.
  std::size_t PurgeTerminal(std::chrono::milliseconds retention);

  // Completion events left unpublished by a failed flag write or a
  // crash. Returns how many went out.
  std::size_t PublishPendingCompletions();

  // Drops entries whose machine is gone. Returns the remaining size.
  std::size_t Compact();

  std::shared_ptr<registry::SessionRegistry> registry() const {
    return registry_;
  }

 private:
  std::shared_ptr<registry::SessionRegistry> registry_;
  storage::ChunkBufferPtr                    buffer_;
  std::shared_ptr<notify::CompletionQueue>   completions_;
  StateMachineOptions                        options_;

  std::mutex                                                          mutex_;
  std::unordered_map<std::string, std::weak_ptr<UploadStateMachine>> machines_;
};

} // namespace upload::session
