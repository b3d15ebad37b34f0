#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "completion_event.hpp"

namespace upload::notify {

/*
  Thread-safe blocking queue between the session state machines and the
  completion worker.
*/
class CompletionQueue {
 public:
  // false once the queue is shut down
  bool Publish(CompletionEvent event);

  // blocking wait; nullopt after Shutdown() once drained
  std::optional<CompletionEvent> Next();

  void Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex          mutex_;
  std::condition_variable     cv_;
  std::queue<CompletionEvent> queue_;
  bool                        shutdown_ = false;
};

} // namespace upload::notify
