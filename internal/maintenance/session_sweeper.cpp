#include "session_sweeper.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace upload::maintenance {

SessionSweeper::SessionSweeper(std::shared_ptr<session::SessionTable> sessions, SweeperOptions options)
    : sessions_(std::move(sessions)), options_(options) {
}

SessionSweeper::~SessionSweeper() {
  Stop();
}

void SessionSweeper::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&SessionSweeper::Run, this);
}

void SessionSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void SessionSweeper::RunOnce() {
  observability::SpanScope span("upload.sweep");

  try {
    const auto expired = sessions_->SweepExpired();
    const auto notified = sessions_->PublishPendingCompletions();
    const auto purged   = sessions_->PurgeTerminal(options_.retention);
    span.SetAttribute("expired", static_cast<std::int64_t>(expired));
    span.SetAttribute("notified", static_cast<std::int64_t>(notified));
    span.SetAttribute("purged", static_cast<std::int64_t>(purged));
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    UPLOAD_LOG_ERROR("session sweep failed", {observability::StringField("error", e.what())});
  }
  sessions_->Compact();
  passes_++;
}

void SessionSweeper::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, options_.interval, [this] { return !running_; })) {
      break;
    }

    lock.unlock();
    RunOnce();
    lock.lock();
  }
}

} // namespace upload::maintenance
