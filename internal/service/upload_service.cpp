#include "upload_service.hpp"

#include <chrono>
#include <type_traits>

#include "internal/channel/connection_multiplexer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/session_registry.hpp"
#include "internal/session/session_table.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace upload::service {

using namespace upload::manager::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  upload::observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      upload::observability::Metrics::Instance().RecordRequest(route, true);
      upload::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      upload::observability::Metrics::Instance().RecordRequest(route, true);
      upload::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    UPLOAD_LOG_WARN("RPC failed", {upload::observability::StringField("route", route), upload::observability::StringField("code", util::ErrorCode(ex)),
                                   upload::observability::StringField("error", ex.what())});
    upload::observability::Metrics::Instance().RecordRequest(route, false);
    upload::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

void RequireSubject(const std::string& subject) {
  if (subject.empty()) {
    throw util::Unauthorized("missing subject id");
  }
  // owner ids become a directory under the blob root
  storage::common::ValidatePathComponent(subject, "subject id");
}

} // namespace

UploadSession ToUploadSession(const db::model::SessionRecord& record) {
  UploadSession session;
  session.set_session_token(record.token);
  session.set_owner_id(record.owner_id);
  session.set_filename(record.filename);
  session.set_file_size(record.file_size);
  session.set_chunk_size(record.chunk_size);
  session.set_total_chunks(record.total_chunks);
  session.set_received_chunks(record.received_chunks);
  session.set_status(record.status);
  *session.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  *session.mutable_expires_at() = util::MillisToProto(record.expires_at_ms);
  if (record.completed_at_ms != 0) {
    *session.mutable_completed_at() = util::MillisToProto(record.completed_at_ms);
  }
  session.set_artifact_id(record.artifact_id);
  session.set_artifact_path(record.artifact_path);
  return session;
}

UploadService::UploadService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

db::model::SessionRecord UploadService::OwnedSession(const std::string& subject, const std::string& token) {
  if (token.empty()) {
    throw util::InvalidArgument("session_token is required");
  }
  auto record = ctx_.sessions->Acquire(token)->Lookup();
  if (record.owner_id != subject) {
    throw util::NotFound("upload session not found");
  }
  return record;
}

CreateSessionResponse UploadService::CreateSession(const std::string& subject, const CreateSessionRequest& req) {
  return ObserveRpc("UploadSessionService.CreateSession", [&] {
    RequireSubject(subject);

    const auto chunk_size = req.chunk_size() == 0 ? ctx_.default_chunk_size : req.chunk_size();
    const auto record     = ctx_.registry->Create(subject, req.filename(), req.file_size(), chunk_size);

    CreateSessionResponse resp;
    resp.set_session_token(record.token);
    resp.set_chunk_size(record.chunk_size);
    resp.set_total_chunks(record.total_chunks);
    *resp.mutable_expires_at() = util::MillisToProto(record.expires_at_ms);
    return resp;
  });
}

UploadSession UploadService::GetSession(const std::string& subject, const GetSessionRequest& req) {
  return ObserveRpc("UploadSessionService.GetSession", [&] {
    RequireSubject(subject);
    return ToUploadSession(OwnedSession(subject, req.session_token()));
  });
}

void UploadService::CancelSession(const std::string& subject, const CancelSessionRequest& req) {
  ObserveRpc("UploadSessionService.CancelSession", [&] {
    RequireSubject(subject);
    OwnedSession(subject, req.session_token());
    ctx_.sessions->Acquire(req.session_token())->Cancel();
  });
}

void UploadService::OpenChannel(const std::string& subject, const std::string& token, const std::shared_ptr<channel::Connection>& connection) {
  ObserveRpc("UploadSessionService.Upload", [&] {
    RequireSubject(subject);
    OwnedSession(subject, token);
    ctx_.multiplexer->Bind(connection, token);
  });
}

bool UploadService::Dispatch(const channel::Connection& connection, const ClientFrame& frame) {
  return ctx_.multiplexer->Dispatch(connection, frame);
}

void UploadService::CloseChannel(const channel::Connection& connection, std::string_view reason) {
  ctx_.multiplexer->Unbind(connection, reason);
}

} // namespace upload::service
