#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/channel/connection_multiplexer.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/upload_server.hpp"
#include "internal/notify/completion_queue.hpp"
#include "internal/registry/session_registry.hpp"
#include "internal/service/upload_service.hpp"
#include "internal/storage/disk/disk_chunk_buffer.hpp"

namespace {

using upload::grpc::ToStatus;

void TestErrorMapping() {
  using namespace upload::util;

  assert(ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(Expired("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(SessionNotActive("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(IllegalTransition("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(Incomplete("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(InvalidSize("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(ChunkDigestMismatch("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(MalformedFrame("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(QuotaExceeded("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(Unauthorized("x")).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(ToStatus(Conflict("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(StorageError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto status = ToStatus(NotFound("upload session not found"));
  assert(status.error_message() == "upload session not found");
}

std::shared_ptr<upload::service::UploadService> BuildService(const std::filesystem::path& root) {
  upload::service::ServiceContext ctx;
  ctx.registry     = std::make_shared<upload::registry::SessionRegistry>(std::make_shared<upload::db::memory::MemoryRepository>(),
                                                                     upload::registry::RegistryOptions{});
  auto buffer      = std::make_shared<upload::storage::DiskChunkBuffer>(root / "staging", root / "blobs", ctx.registry, false);
  ctx.sessions     = std::make_shared<upload::session::SessionTable>(ctx.registry, buffer, std::make_shared<upload::notify::CompletionQueue>());
  ctx.multiplexer  = std::make_shared<upload::channel::ConnectionMultiplexer>(ctx.sessions);
  return std::make_shared<upload::service::UploadService>(ctx);
}

void TestMissingSubjectIsUnauthenticated() {
  const auto root = std::filesystem::temp_directory_path() / "upload_manager_grpc_status";
  std::filesystem::remove_all(root);

  upload::grpc::UploadServer server(BuildService(root));

  upload::manager::v1::CreateSessionRequest req;
  req.set_filename("clip.mp4");
  req.set_file_size(1024);
  upload::manager::v1::CreateSessionResponse resp;
  ::grpc::ServerContext                      grpc_ctx;

  const auto status = server.CreateSession(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(resp.session_token().empty());

  upload::manager::v1::GetSessionRequest get;
  get.set_session_token("whatever");
  upload::manager::v1::UploadSession session;
  ::grpc::ServerContext              get_ctx;
  assert(server.GetSession(&get_ctx, &get, &session).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);

  std::filesystem::remove_all(root);
}

} // namespace

int main() {
  TestErrorMapping();
  TestMissingSubjectIsUnauthenticated();

  std::cout << "upload_manager_unit_grpc_status: pass\n";
  return 0;
}
