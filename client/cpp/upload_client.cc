#include "client/cpp/upload_client.h"

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>

#include <string_view>

namespace upload::manager::client {

using namespace upload::manager::v1;

namespace {

arrow::Status GrpcToArrow(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  switch (status.error_code()) {
    case ::grpc::StatusCode::NOT_FOUND:
      return arrow::Status::KeyError(std::string(action), " failed: ", status.error_message());
    case ::grpc::StatusCode::INVALID_ARGUMENT:
    case ::grpc::StatusCode::FAILED_PRECONDITION:
      return arrow::Status::Invalid(std::string(action), " failed: ", status.error_message());
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
      return arrow::Status::CapacityError(std::string(action), " failed: ", status.error_message());
    default:
      return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
  }
}

double NumberField(const ServerFrame& frame, const std::string& key) {
  const auto& fields = frame.data().fields();
  auto        it     = fields.find(key);
  return it == fields.end() ? 0.0 : it->second.number_value();
}

bool BoolField(const ServerFrame& frame, const std::string& key) {
  const auto& fields = frame.data().fields();
  auto        it     = fields.find(key);
  return it != fields.end() && it->second.bool_value();
}

std::string StringField(const ServerFrame& frame, const std::string& key) {
  const auto& fields = frame.data().fields();
  auto        it     = fields.find(key);
  return it == fields.end() ? std::string{} : it->second.string_value();
}

arrow::Status ErrorFrameToArrow(const ServerFrame& frame) {
  return arrow::Status::IOError("upload error [", StringField(frame, "code"), "]: ", frame.message());
}

using UploadStream = ::grpc::ClientReaderWriter<ClientFrame, ServerFrame>;

/*
  One Upload call. Finish() runs exactly once: when the server closes the
  stream, on Close(), or from the destructor (which cancels first).
*/
class UploadCall {
 public:
  UploadCall(UploadSessionService::Stub& stub, const std::string& subject_id, const std::string& session_token) {
    context_.AddMetadata("x-subject-id", subject_id);
    context_.AddMetadata("x-session-token", session_token);
    stream_ = stub.Upload(&context_);
  }

  ~UploadCall() {
    if (!finished_) {
      context_.TryCancel();
      // CANCELLED by construction
      stream_->Finish();
    }
  }

  arrow::Result<ServerFrame> Read() {
    ServerFrame frame;
    if (stream_->Read(&frame)) {
      return frame;
    }
    finished_         = true;
    const auto status = stream_->Finish();
    ARROW_RETURN_NOT_OK(GrpcToArrow(status, "Upload"));
    return arrow::Status::IOError("upload stream closed by server");
  }

  arrow::Status Write(const ClientFrame& frame) {
    if (!stream_->Write(frame)) {
      return arrow::Status::IOError("upload stream closed while sending '", frame.type(), "'");
    }
    return arrow::Status::OK();
  }

  // Half-close and wait for the server status.
  arrow::Status Close() {
    stream_->WritesDone();
    finished_ = true;
    return GrpcToArrow(stream_->Finish(), "Upload");
  }

 private:
  ::grpc::ClientContext           context_;
  std::unique_ptr<UploadStream> stream_;
  bool                          finished_ = false;
};

arrow::Status SendChunk(UploadCall& call, arrow::io::RandomAccessFile& file, const UploadClient::SessionInfo& info, uint32_t index) {
  const int64_t offset = static_cast<int64_t>(index) * info.chunk_size;
  const int64_t length = index + 1 == info.total_chunks ? static_cast<int64_t>(info.file_size) - offset : info.chunk_size;

  ARROW_ASSIGN_OR_RAISE(auto buffer, file.ReadAt(offset, length));
  if (buffer->size() != length) {
    return arrow::Status::IOError("short read at chunk ", index);
  }

  ClientFrame frame;
  frame.set_type("chunk");
  frame.set_chunk_index(index);
  frame.set_chunk_data(buffer->data(), static_cast<size_t>(buffer->size()));
  return call.Write(frame);
}

} // namespace

arrow::Result<UploadClient::SessionInfo> ParseSessionInfo(const ServerFrame& frame) {
  if (frame.type() == "error") {
    return ErrorFrameToArrow(frame);
  }
  if (frame.type() != "session_info") {
    return arrow::Status::Invalid("expected session_info, got '", frame.type(), "'");
  }

  UploadClient::SessionInfo info;
  info.chunk_size      = static_cast<uint32_t>(NumberField(frame, "chunk_size"));
  info.total_chunks    = static_cast<uint32_t>(NumberField(frame, "total_chunks"));
  info.received_chunks = static_cast<uint32_t>(NumberField(frame, "received_chunks"));
  info.file_size       = static_cast<uint64_t>(NumberField(frame, "file_size"));

  const auto& fields = frame.data().fields();
  if (auto it = fields.find("missing_chunks"); it != fields.end()) {
    for (const auto& value : it->second.list_value().values()) {
      info.missing_chunks.push_back(static_cast<uint32_t>(value.number_value()));
    }
  }
  return info;
}

UploadClient::UploadClient(std::shared_ptr<::grpc::Channel> channel, std::string subject_id)
    : stub_(UploadSessionService::NewStub(channel)), subject_id_(std::move(subject_id)) {}

void UploadClient::Decorate(::grpc::ClientContext* context) const {
  context->AddMetadata("x-subject-id", subject_id_);
}

arrow::Result<CreateSessionResponse> UploadClient::CreateSession(const std::string& filename, uint64_t file_size,
                                                                 uint32_t chunk_size) const {
  ::grpc::ClientContext ctx;
  Decorate(&ctx);

  CreateSessionRequest req;
  req.set_filename(filename);
  req.set_file_size(file_size);
  req.set_chunk_size(chunk_size);

  CreateSessionResponse resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->CreateSession(&ctx, req, &resp), "CreateSession"));
  return resp;
}

arrow::Result<UploadSession> UploadClient::GetSession(const std::string& session_token) const {
  ::grpc::ClientContext ctx;
  Decorate(&ctx);

  GetSessionRequest req;
  req.set_session_token(session_token);

  UploadSession resp;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->GetSession(&ctx, req, &resp), "GetSession"));
  return resp;
}

arrow::Status UploadClient::CancelSession(const std::string& session_token) const {
  ::grpc::ClientContext ctx;
  Decorate(&ctx);

  CancelSessionRequest req;
  req.set_session_token(session_token);

  google::protobuf::Empty resp;
  return GrpcToArrow(stub_->CancelSession(&ctx, req, &resp), "CancelSession");
}

arrow::Result<UploadClient::UploadResult> UploadClient::UploadFile(const std::string& session_token, const std::string& path,
                                                                   const ProgressCallback& on_progress) const {
  ARROW_ASSIGN_OR_RAISE(auto file, arrow::io::ReadableFile::Open(path));

  UploadCall call(*stub_, subject_id_, session_token);

  ARROW_ASSIGN_OR_RAISE(auto first, call.Read());
  ARROW_ASSIGN_OR_RAISE(auto info, ParseSessionInfo(first));

  ARROW_ASSIGN_OR_RAISE(auto local_size, file->GetSize());
  if (static_cast<uint64_t>(local_size) != info.file_size) {
    return arrow::Status::Invalid("local file is ", local_size, " bytes, session expects ", info.file_size);
  }

  UploadResult result;
  int          finalize_retries = 0;

  // A fully received session that is still active had its finalize fail;
  // resending any chunk re-runs it.
  std::vector<uint32_t> pending = info.missing_chunks;
  if (pending.empty() && info.total_chunks > 0) {
    pending.push_back(info.total_chunks - 1);
  }

  for (std::size_t next = 0; next < pending.size(); ++next) {
    const auto index = pending[next];
    ARROW_RETURN_NOT_OK(SendChunk(call, *file, info, index));
    result.chunks_sent++;

    ARROW_ASSIGN_OR_RAISE(auto reply, call.Read());
    if (reply.type() == "error") {
      return ErrorFrameToArrow(reply);
    }

    Progress progress;
    progress.received_chunks = static_cast<uint32_t>(NumberField(reply, "received_chunks"));
    progress.total_chunks    = static_cast<uint32_t>(NumberField(reply, "total_chunks"));
    progress.fraction        = NumberField(reply, "progress");
    if (on_progress) {
      on_progress(progress);
    }
    if (progress.received_chunks != progress.total_chunks) {
      continue;
    }

    ARROW_ASSIGN_OR_RAISE(auto outcome, call.Read());
    if (outcome.type() == "upload_complete") {
      result.video_id   = StringField(outcome, "video_id");
      result.filename   = StringField(outcome, "filename");
      result.path       = StringField(outcome, "path");
      result.size_bytes = static_cast<uint64_t>(NumberField(outcome, "size"));
      ARROW_RETURN_NOT_OK(call.Close());
      return result;
    }

    if (outcome.type() == "error" && BoolField(outcome, "retryable") && finalize_retries < kMaxFinalizeRetries) {
      finalize_retries++;
      pending.push_back(index);
      continue;
    }
    if (outcome.type() == "error") {
      return ErrorFrameToArrow(outcome);
    }
    return arrow::Status::Invalid("unexpected frame '", outcome.type(), "'");
  }

  return arrow::Status::IOError("upload ended without completion");
}

arrow::Status UploadClient::CancelOverChannel(const std::string& session_token) const {
  UploadCall call(*stub_, subject_id_, session_token);

  ARROW_ASSIGN_OR_RAISE(auto first, call.Read());
  ARROW_RETURN_NOT_OK(ParseSessionInfo(first).status());

  ClientFrame cancel;
  cancel.set_type("cancel");
  ARROW_RETURN_NOT_OK(call.Write(cancel));

  ARROW_ASSIGN_OR_RAISE(auto reply, call.Read());
  if (reply.type() == "error") {
    return ErrorFrameToArrow(reply);
  }
  return call.Close();
}

} // namespace upload::manager::client
