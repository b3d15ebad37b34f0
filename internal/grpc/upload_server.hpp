#pragma once

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/service/upload_service.hpp"
#include "upload/manager/v1.hpp"

namespace upload::grpc {

inline constexpr const char* kSubjectMetadataKey = "x-subject-id";
inline constexpr const char* kTokenMetadataKey   = "x-session-token";

class UploadServer final : public upload::manager::v1::UploadSessionService::Service {
public:
  explicit UploadServer(std::shared_ptr<upload::service::UploadService> svc);

  ::grpc::Status CreateSession(::grpc::ServerContext*,
                               const upload::manager::v1::CreateSessionRequest*,
                               upload::manager::v1::CreateSessionResponse*) override;

  ::grpc::Status GetSession(::grpc::ServerContext*,
                            const upload::manager::v1::GetSessionRequest*,
                            upload::manager::v1::UploadSession*) override;

  ::grpc::Status CancelSession(::grpc::ServerContext*,
                               const upload::manager::v1::CancelSessionRequest*,
                               google::protobuf::Empty*) override;

  // One handler thread per stream; returns when the client half-closes,
  // the connection is replaced, or it is closed for malformed frames.
  ::grpc::Status Upload(::grpc::ServerContext*,
                        ::grpc::ServerReaderWriter<upload::manager::v1::ServerFrame,
                                                   upload::manager::v1::ClientFrame>*) override;

private:
  std::shared_ptr<upload::service::UploadService> service_;
};

// First value of a request metadata key, "" when absent.
std::string MetadataValue(const ::grpc::ServerContext& context, const std::string& key);

} // namespace upload::grpc
