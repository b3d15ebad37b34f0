#include "upload_state_machine.hpp"

#include <chrono>

#include "frames.hpp"
#include "internal/model/session_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace upload::session {

using namespace upload::manager::v1;
using db::model::SessionRecord;
using observability::IntField;
using observability::StringField;

namespace {

bool IsRetryable(const std::exception& e) {
  return dynamic_cast<const util::StorageError*>(&e) != nullptr || dynamic_cast<const util::Conflict*>(&e) != nullptr;
}

} // namespace

UploadStateMachine::UploadStateMachine(std::string token, std::shared_ptr<registry::SessionRegistry> registry, storage::ChunkBufferPtr buffer,
                                       std::shared_ptr<notify::CompletionQueue> completions, StateMachineOptions options)
    : token_(std::move(token)),
      registry_(std::move(registry)),
      buffer_(std::move(buffer)),
      completions_(std::move(completions)),
      options_(options) {
}

std::vector<ServerFrame> UploadStateMachine::Handle(const ClientFrame& frame) {
  std::lock_guard lock(mutex_);
  observability::ScopedLogContext log_context{observability::TokenField("session", token_)};

  try {
    if (frame.type() == kChunkMessage) {
      return HandleChunk(frame);
    }
    if (frame.type() == kCancelMessage) {
      return HandleCancel();
    }
    throw util::UnknownMessageKind("unknown message type '" + frame.type() + "'");
  } catch (const util::Expired& e) {
    DiscardStaging("expired");
    return {MakeErrorFrame(e)};
  } catch (const std::exception& e) {
    UPLOAD_LOG_DEBUG("upload message rejected", {StringField("type", frame.type()), StringField("code", util::ErrorCode(e)),
                                                 StringField("error", e.what())});
    return {MakeErrorFrame(e, IsRetryable(e))};
  }
}

std::vector<ServerFrame> UploadStateMachine::HandleChunk(const ClientFrame& frame) {
  observability::SpanScope span("upload.chunk");
  span.SetAttribute("chunk_index", static_cast<std::int64_t>(frame.chunk_index()));

  SessionRecord session;
  try {
    session = registry_->VerifyChunk(token_, frame.chunk_index(), frame.chunk_digest());
  } catch (const util::SessionNotActive&) {
    // a completed session whose event was never stored answers with it now
    std::vector<ServerFrame> out;
    const auto current = registry_->Lookup(token_);
    if (current.status == SESSION_STATUS_COMPLETED && !current.notified) {
      NotifyCompletion(current, out);
    }
    if (out.empty()) throw;
    return out;
  }
  buffer_->Write(session, frame.chunk_index(), frame.chunk_data());

  const auto receipt = registry_->RecordChunk(token_, frame.chunk_index(), frame.chunk_digest());
  observability::Metrics::Instance().RecordChunkBytes(frame.chunk_data().size());

  std::vector<ServerFrame> out;
  out.push_back(MakeProgressFrame(receipt.received_chunks, receipt.total_chunks, frame.chunk_index()));

  if (receipt.received_chunks == receipt.total_chunks) {
    TryFinalize(out);
  }
  return out;
}

std::vector<ServerFrame> UploadStateMachine::HandleCancel() {
  const auto session = registry_->Lookup(token_);
  if (model::IsTerminal(session.status)) {
    if (session.status == SESSION_STATUS_EXPIRED) {
      DiscardStaging("expired");
    }
    throw util::SessionNotActive("upload session is " + std::string(model::StatusName(session.status)));
  }

  auto cancelled = registry_->Transition(token_, SESSION_STATUS_CANCELLED);
  DiscardStaging("cancelled");
  return {MakeCancelledFrame(cancelled)};
}

void UploadStateMachine::TryFinalize(std::vector<ServerFrame>& out) {
  observability::SpanScope span("upload.finalize");
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  registry_->Transition(token_, SESSION_STATUS_COMPLETING);

  SessionRecord completed;
  try {
    const auto session = registry_->Lookup(token_);
    const auto path    = buffer_->Finalize(session);
    completed          = registry_->Transition(token_, SESSION_STATUS_COMPLETED, path.string());
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().ObserveFinalizeMs(elapsed_ms(), false);

    try {
      registry_->Transition(token_, SESSION_STATUS_ACTIVE);
    } catch (const std::exception& revert_error) {
      // RecoverInFlight puts it back on the next start
      UPLOAD_LOG_ERROR("finalize revert failed", {StringField("error", revert_error.what())});
    }

    const auto failures = registry_->RecordFinalizeFailure(token_);
    const bool fatal    = failures >= options_.max_finalize_attempts;
    UPLOAD_LOG_WARN("finalize failed", {IntField("failures", failures), observability::BoolField("fatal", fatal),
                                        StringField("error", e.what())});
    out.push_back(MakeErrorFrame(e, !fatal, fatal));
    return;
  }

  observability::Metrics::Instance().ObserveFinalizeMs(elapsed_ms(), true);
  observability::Metrics::Instance().RecordArtifactBytes(completed.file_size);
  NotifyCompletion(completed, out);
}

void UploadStateMachine::NotifyCompletion(const SessionRecord& session, std::vector<ServerFrame>& out) {
  bool first = false;
  try {
    first = registry_->MarkNotified(token_);
  } catch (const std::exception& e) {
    // stays pending: a resent chunk or the next sweep delivers it
    UPLOAD_LOG_ERROR("completion flag not stored", {StringField("artifact_id", session.artifact_id), StringField("error", e.what())});
    out.push_back(MakeErrorFrame(e, true));
    return;
  }
  if (!first) {
    return;
  }

  out.push_back(MakeCompleteFrame(session));

  notify::CompletionEvent event;
  event.artifact_id     = session.artifact_id;
  event.owner_id        = session.owner_id;
  event.filename        = session.filename;
  event.path            = session.artifact_path;
  event.mime_type       = registry::MimeTypeForFilename(session.filename);
  event.size_bytes      = session.file_size;
  event.completed_at_ms = session.completed_at_ms;
  if (!completions_->Publish(std::move(event))) {
    UPLOAD_LOG_WARN("completion queue closed, event dropped", {StringField("artifact_id", session.artifact_id)});
  }
}

bool UploadStateMachine::PublishPendingCompletion() {
  std::lock_guard lock(mutex_);
  observability::ScopedLogContext log_context{observability::TokenField("session", token_)};

  const auto session = registry_->Lookup(token_);
  if (session.status != SESSION_STATUS_COMPLETED || session.notified) {
    return false;
  }
  std::vector<ServerFrame> frames;
  NotifyCompletion(session, frames);
  return !frames.empty() && frames.front().type() == kUploadCompleteFrame;
}

ServerFrame UploadStateMachine::Describe() {
  std::lock_guard lock(mutex_);

  const auto session = registry_->Lookup(token_);
  if (session.status == SESSION_STATUS_EXPIRED) {
    DiscardStaging("expired");
    throw util::Expired("upload session expired");
  }
  if (session.status != SESSION_STATUS_ACTIVE) {
    throw util::SessionNotActive("upload session is " + std::string(model::StatusName(session.status)));
  }
  return MakeSessionInfoFrame(session, registry_->MissingChunks(token_));
}

SessionRecord UploadStateMachine::Lookup() {
  std::lock_guard lock(mutex_);

  auto session = registry_->Lookup(token_);
  if (session.status == SESSION_STATUS_EXPIRED) {
    DiscardStaging("expired");
  }
  return session;
}

SessionRecord UploadStateMachine::Cancel() {
  std::lock_guard lock(mutex_);
  observability::ScopedLogContext log_context{observability::TokenField("session", token_)};

  const auto session = registry_->Lookup(token_);
  switch (session.status) {
    case SESSION_STATUS_CANCELLED:
    case SESSION_STATUS_EXPIRED:
      DiscardStaging(model::StatusName(session.status).data());
      return session;
    case SESSION_STATUS_COMPLETED:
      throw util::SessionNotActive("upload session is completed");
    default:
      break;
  }

  auto cancelled = registry_->Transition(token_, SESSION_STATUS_CANCELLED);
  DiscardStaging("cancelled");
  return cancelled;
}

void UploadStateMachine::OnExpired() {
  std::lock_guard lock(mutex_);
  DiscardStaging("expired");
}

void UploadStateMachine::OnPurged() {
  std::lock_guard lock(mutex_);
  DiscardStaging("purged");
}

void UploadStateMachine::DiscardStaging(const char* reason) {
  try {
    buffer_->Discard(token_);
  } catch (const std::exception& e) {
    UPLOAD_LOG_WARN("staging discard failed",
                    {observability::TokenField("session", token_), StringField("reason", reason), StringField("error", e.what())});
  }
}

} // namespace upload::session
