#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "upload/manager/v1.hpp"

namespace upload::manager::client {

/*
  Thin client for UploadSessionService.

  Every call carries the subject id given at construction as x-subject-id
  metadata. UploadFile drives the duplex channel: it binds to the session,
  sends only the chunks the server reports as missing (so a second call on
  the same token resumes), and waits for upload_complete.
*/
class UploadClient {
 public:
  struct Progress {
    uint32_t received_chunks = 0;
    uint32_t total_chunks    = 0;
    double   fraction        = 0.0;
  };

  struct UploadResult {
    std::string video_id;
    std::string filename;
    std::string path;
    uint64_t    size_bytes  = 0;
    uint32_t    chunks_sent = 0;
  };

  struct SessionInfo {
    uint32_t              chunk_size      = 0;
    uint32_t              total_chunks    = 0;
    uint32_t              received_chunks = 0;
    uint64_t              file_size       = 0;
    std::vector<uint32_t> missing_chunks;
  };

  using ProgressCallback = std::function<void(const Progress&)>;

  UploadClient(std::shared_ptr<::grpc::Channel> channel, std::string subject_id);

  arrow::Result<upload::manager::v1::CreateSessionResponse> CreateSession(const std::string& filename, uint64_t file_size,
                                                                          uint32_t chunk_size = 0) const;

  arrow::Result<upload::manager::v1::UploadSession> GetSession(const std::string& session_token) const;

  arrow::Status CancelSession(const std::string& session_token) const;

  arrow::Result<UploadResult> UploadFile(const std::string& session_token, const std::string& path,
                                         const ProgressCallback& on_progress = nullptr) const;

  // Cancels over the duplex channel instead of the unary RPC.
  arrow::Status CancelOverChannel(const std::string& session_token) const;

  // Resends after a retryable finalize failure.
  static constexpr int kMaxFinalizeRetries = 2;

 private:
  void Decorate(::grpc::ClientContext* context) const;

  std::unique_ptr<upload::manager::v1::UploadSessionService::Stub> stub_;
  std::string                                                      subject_id_;
};

// session_info frame -> SessionInfo; Invalid when the frame is not one.
arrow::Result<UploadClient::SessionInfo> ParseSessionInfo(const upload::manager::v1::ServerFrame& frame);

} // namespace upload::manager::client
