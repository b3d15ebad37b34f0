#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "analysis_dispatcher.hpp"
#include "completion_queue.hpp"

namespace upload::notify {

/*
  Background worker that drains completion events into the analysis
  dispatcher. Stop() drains what is already queued before joining.
*/
class CompletionWorker {
 public:
  CompletionWorker(std::shared_ptr<CompletionQueue> queue, std::shared_ptr<AnalysisDispatcher> dispatcher);
  ~CompletionWorker();

  void Start();
  void Stop();

  uint64_t dispatched() const {
    return dispatched_.load();
  }

 private:
  void Run();

  std::shared_ptr<CompletionQueue>    queue_;
  std::shared_ptr<AnalysisDispatcher> dispatcher_;

  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> dispatched_{0};
};

} // namespace upload::notify
