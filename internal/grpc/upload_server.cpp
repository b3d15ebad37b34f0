#include "upload_server.hpp"

#include <atomic>
#include <mutex>

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"

namespace upload::grpc {

using upload::manager::v1::ClientFrame;
using upload::manager::v1::ServerFrame;

namespace {

/*
  Duplex stream adapter. Writes are serialized; Close cancels the call so
  the handler's blocking Read returns.
*/
class GrpcStreamConnection final : public upload::channel::Connection {
public:
  GrpcStreamConnection(::grpc::ServerContext* context, ::grpc::ServerReaderWriter<ServerFrame, ClientFrame>* stream)
      : id_(util::ToString(util::GenerateUUID())), context_(context), stream_(stream) {}

  const std::string& Id() const override {
    return id_;
  }

  bool Send(const ServerFrame& frame) override {
    std::lock_guard lock(write_mutex_);
    if (closed_) {
      return false;
    }
    return stream_->Write(frame);
  }

  // The peer gets a fatal error frame naming the reason before the call
  // is cancelled.
  void Close(std::string_view reason) override {
    {
      std::lock_guard lock(write_mutex_);
      if (closed_) {
        return;
      }
      closed_       = true;
      close_reason_ = std::string(reason);

      ServerFrame farewell;
      farewell.set_type("error");
      farewell.set_message("connection closed: " + close_reason_);
      auto& fields = *farewell.mutable_data()->mutable_fields();
      fields["code"].set_string_value(close_reason_);
      fields["retryable"].set_bool_value(false);
      fields["fatal"].set_bool_value(true);
      if (!stream_->Write(farewell)) {
        UPLOAD_LOG_DEBUG("close frame not delivered", {observability::StringField("connection", id_)});
      }
      context_->TryCancel();
    }
  }

  // Called by the handler before it returns; stream and context are gone
  // afterwards, so later Send/Close calls become no-ops.
  void Detach() {
    std::lock_guard lock(write_mutex_);
    closed_ = true;
  }

  bool closed() const {
    std::lock_guard lock(write_mutex_);
    return closed_;
  }

  std::string close_reason() const {
    std::lock_guard lock(write_mutex_);
    return close_reason_;
  }

private:
  std::string                                            id_;
  ::grpc::ServerContext*                                 context_;
  ::grpc::ServerReaderWriter<ServerFrame, ClientFrame>* stream_;

  mutable std::mutex write_mutex_;
  bool               closed_ = false;
  std::string        close_reason_;
};

} // namespace

std::string MetadataValue(const ::grpc::ServerContext& context, const std::string& key) {
  const auto& metadata = context.client_metadata();
  auto        it       = metadata.find(key);
  if (it == metadata.end()) {
    return {};
  }
  return std::string(it->second.data(), it->second.size());
}

UploadServer::UploadServer(std::shared_ptr<upload::service::UploadService> svc)
    : service_(std::move(svc)) {}

::grpc::Status UploadServer::CreateSession(::grpc::ServerContext* context,
                                           const upload::manager::v1::CreateSessionRequest* req,
                                           upload::manager::v1::CreateSessionResponse* resp) {
  try {
    *resp = service_->CreateSession(MetadataValue(*context, kSubjectMetadataKey), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::GetSession(::grpc::ServerContext* context,
                                        const upload::manager::v1::GetSessionRequest* req,
                                        upload::manager::v1::UploadSession* resp) {
  try {
    *resp = service_->GetSession(MetadataValue(*context, kSubjectMetadataKey), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::CancelSession(::grpc::ServerContext* context,
                                           const upload::manager::v1::CancelSessionRequest* req,
                                           google::protobuf::Empty*) {
  try {
    service_->CancelSession(MetadataValue(*context, kSubjectMetadataKey), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::Upload(::grpc::ServerContext* context,
                                    ::grpc::ServerReaderWriter<ServerFrame, ClientFrame>* stream) {
  auto connection = std::make_shared<GrpcStreamConnection>(context, stream);

  try {
    service_->OpenChannel(MetadataValue(*context, kSubjectMetadataKey), MetadataValue(*context, kTokenMetadataKey), connection);
  } catch (const std::exception& e) {
    connection->Detach();
    return ToStatus(e);
  }

  ClientFrame frame;
  while (!connection->closed() && stream->Read(&frame)) {
    if (!service_->Dispatch(*connection, frame)) {
      break;
    }
  }
  service_->CloseChannel(*connection, context->IsCancelled() ? "cancelled" : "disconnect");

  const auto reason = connection->close_reason();
  connection->Detach();

  if (!reason.empty()) {
    return {::grpc::StatusCode::ABORTED, "connection closed: " + reason};
  }
  return ::grpc::Status::OK;
}

} // namespace upload::grpc
