#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/session/session_table.hpp"

namespace upload::maintenance {

struct SweeperOptions {
  std::chrono::milliseconds interval{std::chrono::seconds(60)};
  std::chrono::milliseconds retention{std::chrono::hours(24 * 7)};
};

/*
  Background worker for session housekeeping.

  Every interval:
      active past expiry    → expired, staging discarded
      completed, not notified → completion event published
      terminal past retention → rows purged, leftover staging removed
*/
class SessionSweeper {
 public:
  SessionSweeper(std::shared_ptr<session::SessionTable> sessions, SweeperOptions options);
  ~SessionSweeper();

  void Start();
  void Stop();

  // One pass, on the caller's thread.
  void RunOnce();

  uint64_t passes() const {
    return passes_.load();
  }

 private:
  void Run();

  std::shared_ptr<session::SessionTable> sessions_;
  SweeperOptions                         options_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::atomic<bool>       running_{false};
  std::atomic<uint64_t>   passes_{0};
};

} // namespace upload::maintenance
