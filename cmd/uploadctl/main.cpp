#include <grpcpp/grpcpp.h>

#include <google/protobuf/util/time_util.h>

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/upload_client.h"
#include "upload/manager/v1.hpp"

using namespace upload::manager::v1;
using upload::manager::client::UploadClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  uploadctl <addr> <subject> create <filename> <size_bytes> [chunk_size]\n"
            << "  uploadctl <addr> <subject> upload <file> [chunk_size]\n"
            << "  uploadctl <addr> <subject> resume <token> <file>\n"
            << "  uploadctl <addr> <subject> status <token>\n"
            << "  uploadctl <addr> <subject> cancel <token>\n";
}

static const char* StatusName(SessionStatus status) {
  switch (status) {
    case SESSION_STATUS_ACTIVE:
      return "active";
    case SESSION_STATUS_COMPLETING:
      return "completing";
    case SESSION_STATUS_COMPLETED:
      return "completed";
    case SESSION_STATUS_CANCELLED:
      return "cancelled";
    case SESSION_STATUS_EXPIRED:
      return "expired";
    default:
      return "unspecified";
  }
}

static void PrintProgress(const UploadClient::Progress& progress) {
  std::cout << "\r" << progress.received_chunks << "/" << progress.total_chunks << " chunks ("
            << static_cast<int>(progress.fraction * 100.0) << "%)" << std::flush;
}

static int RunUpload(const UploadClient& client, const std::string& token, const std::string& path) {
  auto result = client.UploadFile(token, path, PrintProgress);
  std::cout << "\n";
  if (!result.ok()) {
    std::cerr << result.status().ToString() << "\n";
    std::cerr << "resume with: uploadctl <addr> <subject> resume " << token << " " << path << "\n";
    return 2;
  }

  std::cout << "video_id=" << result->video_id << "\n"
            << "path=" << result->path << "\n"
            << "size=" << result->size_bytes << "\n"
            << "chunks_sent=" << result->chunks_sent << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string addr    = argv[1];
  std::string subject = argv[2];
  std::string cmd     = argv[3];

  UploadClient client(::grpc::CreateChannel(addr, ::grpc::InsecureChannelCredentials()), subject);

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    const uint64_t size_bytes = std::stoull(argv[5]);
    const uint32_t chunk_size = argc >= 7 ? static_cast<uint32_t>(std::stoul(argv[6])) : 0;

    auto resp = client.CreateSession(argv[4], size_bytes, chunk_size);
    if (!resp.ok()) {
      std::cerr << resp.status().ToString() << "\n";
      return 2;
    }

    std::cout << "session_token=" << resp->session_token() << "\n"
              << "chunk_size=" << resp->chunk_size() << "\n"
              << "total_chunks=" << resp->total_chunks() << "\n"
              << "expires_at=" << google::protobuf::util::TimeUtil::ToString(resp->expires_at()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "upload") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    const std::filesystem::path path = argv[4];
    std::error_code             ec;
    const auto                  size_bytes = std::filesystem::file_size(path, ec);
    if (ec) {
      std::cerr << "cannot stat " << path << ": " << ec.message() << "\n";
      return 1;
    }
    const uint32_t chunk_size = argc >= 6 ? static_cast<uint32_t>(std::stoul(argv[5])) : 0;

    auto session = client.CreateSession(path.filename().string(), size_bytes, chunk_size);
    if (!session.ok()) {
      std::cerr << session.status().ToString() << "\n";
      return 2;
    }
    std::cout << "session_token=" << session->session_token() << "\n";
    return RunUpload(client, session->session_token(), path.string());
  }

  // ------------------------------------------------------------

  if (cmd == "resume") {
    if (argc < 6) {
      Usage();
      return 1;
    }
    return RunUpload(client, argv[4], argv[5]);
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    auto session = client.GetSession(argv[4]);
    if (!session.ok()) {
      std::cerr << session.status().ToString() << "\n";
      return 2;
    }

    std::cout << "status=" << StatusName(session->status()) << "\n"
              << "filename=" << session->filename() << "\n"
              << "received_chunks=" << session->received_chunks() << "/" << session->total_chunks() << "\n"
              << "expires_at=" << google::protobuf::util::TimeUtil::ToString(session->expires_at()) << "\n";
    if (session->status() == SESSION_STATUS_COMPLETED) {
      std::cout << "video_id=" << session->artifact_id() << "\n"
                << "path=" << session->artifact_path() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    auto status = client.CancelSession(argv[4]);
    if (!status.ok()) {
      std::cerr << status.ToString() << "\n";
      return 2;
    }
    std::cout << "cancelled\n";
    return 0;
  }

  Usage();
  return 1;
}
