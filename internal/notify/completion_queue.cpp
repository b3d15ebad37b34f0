#include "completion_queue.hpp"

namespace upload::notify {

bool CompletionQueue::Publish(CompletionEvent event) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(event));
  }
  cv_.notify_one();
  return true;
}

std::optional<CompletionEvent> CompletionQueue::Next() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  CompletionEvent event = std::move(queue_.front());
  queue_.pop();
  return event;
}

void CompletionQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t CompletionQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace upload::notify
