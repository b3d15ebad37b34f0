#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/notify/completion_worker.hpp"

namespace {

using upload::notify::CompletionEvent;
using upload::notify::CompletionQueue;
using upload::notify::CompletionWorker;

class RecordingDispatcher final : public upload::notify::AnalysisDispatcher {
 public:
  void Dispatch(const CompletionEvent& event) override {
    if (event.artifact_id == "poison") {
      throw std::runtime_error("analysis backend rejected event");
    }
    std::lock_guard lock(mutex_);
    seen_.push_back(event.artifact_id);
  }

  std::vector<std::string> seen() const {
    std::lock_guard lock(mutex_);
    return seen_;
  }

 private:
  mutable std::mutex       mutex_;
  std::vector<std::string> seen_;
};

CompletionEvent Event(const std::string& id) {
  CompletionEvent event;
  event.artifact_id = id;
  event.owner_id    = "alice";
  event.filename    = id + ".mp4";
  event.mime_type   = "video/mp4";
  return event;
}

void TestQueueOrderAndShutdown() {
  CompletionQueue queue;
  assert(queue.Publish(Event("a")));
  assert(queue.Publish(Event("b")));
  assert(queue.Size() == 2);

  queue.Shutdown();
  assert(!queue.Publish(Event("c")));

  // drained after shutdown, then nullopt
  assert(queue.Next()->artifact_id == "a");
  assert(queue.Next()->artifact_id == "b");
  assert(!queue.Next().has_value());
}

void TestNextBlocksUntilPublish() {
  CompletionQueue queue;

  std::thread producer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.Publish(Event("late"));
  });

  auto event = queue.Next();
  producer.join();
  assert(event.has_value());
  assert(event->artifact_id == "late");
}

void TestWorkerDispatchesEverythingAndSurvivesFailures() {
  auto queue      = std::make_shared<CompletionQueue>();
  auto dispatcher = std::make_shared<RecordingDispatcher>();

  CompletionWorker worker(queue, dispatcher);
  worker.Start();

  queue->Publish(Event("one"));
  queue->Publish(Event("poison"));
  queue->Publish(Event("two"));

  // Stop drains what is queued
  worker.Stop();

  const auto seen = dispatcher->seen();
  assert((seen == std::vector<std::string>{"one", "two"}));
  assert(worker.dispatched() == 2);
}

void TestLoggingDispatcher() {
  upload::notify::LoggingAnalysisDispatcher dispatcher;
  dispatcher.Dispatch(Event("logged"));
}

} // namespace

int main() {
  TestQueueOrderAndShutdown();
  TestNextBlocksUntilPublish();
  TestWorkerDispatchesEverythingAndSurvivesFailures();
  TestLoggingDispatcher();

  std::cout << "upload_manager_unit_completion_worker: pass\n";
  return 0;
}
