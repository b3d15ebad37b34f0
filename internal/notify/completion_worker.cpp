#include "completion_worker.hpp"

#include "internal/observability/logging.hpp"

namespace upload::notify {

using observability::IntField;
using observability::StringField;

LoggingAnalysisDispatcher::LoggingAnalysisDispatcher(std::string analysis_type) : analysis_type_(std::move(analysis_type)) {
}

void LoggingAnalysisDispatcher::Dispatch(const CompletionEvent& event) {
  UPLOAD_LOG_INFO("analysis requested", {StringField("video_id", event.artifact_id), StringField("owner", event.owner_id),
                                         StringField("analysis_type", analysis_type_), StringField("path", event.path),
                                         StringField("mime_type", event.mime_type), IntField("size", static_cast<int64_t>(event.size_bytes))});
}

CompletionWorker::CompletionWorker(std::shared_ptr<CompletionQueue> queue, std::shared_ptr<AnalysisDispatcher> dispatcher)
    : queue_(std::move(queue)), dispatcher_(std::move(dispatcher)) {
}

CompletionWorker::~CompletionWorker() {
  Stop();
}

void CompletionWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&CompletionWorker::Run, this);
}

void CompletionWorker::Stop() {
  queue_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void CompletionWorker::Run() {
  while (true) {
    auto event = queue_->Next();
    if (!event) break;

    try {
      dispatcher_->Dispatch(*event);
      dispatched_++;
    } catch (const std::exception& e) {
      UPLOAD_LOG_ERROR("analysis dispatch failed", {StringField("video_id", event->artifact_id), StringField("error", e.what())});
    }
  }
}

} // namespace upload::notify
