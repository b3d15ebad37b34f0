#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "client/cpp/upload_client.h"
#include "upload/manager/v1.hpp"

namespace {

// Deterministic pattern so the stored artifact can be compared by eye.
bool WriteSampleFile(const std::filesystem::path& path, uint64_t size) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  for (uint64_t i = 0; i < size; ++i) {
    out.put(static_cast<char>((i * 31) & 0xFF));
  }
  return static_cast<bool>(out);
}

} // namespace

int main(int argc, char** argv) {
  // Allow overriding the service endpoint for remote or containerized runs.
  const std::string target  = argc > 1 ? argv[1] : "localhost:50061";
  const std::string subject = argc > 2 ? argv[2] : "example-user";

  upload::manager::client::UploadClient client(::grpc::CreateChannel(target, ::grpc::InsecureChannelCredentials()), subject);

  // 3.5 chunks of 1 MiB: the last chunk is short.
  constexpr uint64_t kFileSize  = 3 * 1024 * 1024 + 512 * 1024;
  constexpr uint32_t kChunkSize = 1024 * 1024;

  const auto sample = std::filesystem::temp_directory_path() / "upload-example.mp4";
  if (!WriteSampleFile(sample, kFileSize)) {
    std::cerr << "cannot write " << sample << '\n';
    return 1;
  }

  auto session = client.CreateSession(sample.filename().string(), kFileSize, kChunkSize);
  if (!session.ok()) {
    std::cerr << "CreateSession failed: " << session.status().ToString() << '\n';
    return 1;
  }
  const auto token = session->session_token();
  std::cout << "created session with " << session->total_chunks() << " chunks\n";

  auto uploaded = client.UploadFile(token, sample.string(), [](const auto& progress) {
    std::cout << "  progress " << progress.received_chunks << "/" << progress.total_chunks << '\n';
  });
  if (!uploaded.ok()) {
    // The session stays active; running UploadFile again on the same token
    // only sends the chunks the server is still missing.
    std::cerr << "UploadFile failed: " << uploaded.status().ToString() << '\n';
    return 1;
  }
  std::cout << "video_id=" << uploaded->video_id << " path=" << uploaded->path << '\n';

  auto status = client.GetSession(token);
  if (!status.ok()) {
    std::cerr << "GetSession failed: " << status.status().ToString() << '\n';
    return 1;
  }
  std::cout << "status=" << upload::manager::v1::SessionStatus_Name(status->status()) << '\n';

  // A second session cancelled over the duplex channel.
  auto abandoned = client.CreateSession("abandoned.mov", kFileSize, kChunkSize);
  if (!abandoned.ok()) {
    std::cerr << "CreateSession failed: " << abandoned.status().ToString() << '\n';
    return 1;
  }
  auto cancel_status = client.CancelOverChannel(abandoned->session_token());
  if (!cancel_status.ok()) {
    std::cerr << "cancel failed: " << cancel_status.ToString() << '\n';
    return 1;
  }
  std::cout << "second session cancelled\n";

  std::filesystem::remove(sample);
  return 0;
}
