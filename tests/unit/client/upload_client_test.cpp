#include "client/cpp/upload_client.h"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

namespace {

using upload::manager::client::ParseSessionInfo;
using upload::manager::client::UploadClient;
using upload::manager::v1::ServerFrame;

ServerFrame SessionInfoFrame() {
  ServerFrame frame;
  frame.set_type("session_info");
  auto& fields = *frame.mutable_data()->mutable_fields();
  fields["chunk_size"].set_number_value(1'048'576);
  fields["total_chunks"].set_number_value(10);
  fields["received_chunks"].set_number_value(7);
  fields["file_size"].set_number_value(10'000'000);
  auto* missing = fields["missing_chunks"].mutable_list_value();
  missing->add_values()->set_number_value(2);
  missing->add_values()->set_number_value(5);
  missing->add_values()->set_number_value(9);
  return frame;
}

void TestParseSessionInfo() {
  const auto info = ParseSessionInfo(SessionInfoFrame());
  assert(info.ok());
  assert(info->chunk_size == 1'048'576);
  assert(info->total_chunks == 10);
  assert(info->received_chunks == 7);
  assert(info->file_size == 10'000'000);
  assert((info->missing_chunks == std::vector<uint32_t>{2, 5, 9}));
}

void TestParseSessionInfoRejectsOtherFrames() {
  ServerFrame progress;
  progress.set_type("progress");
  const auto not_info = ParseSessionInfo(progress);
  assert(!not_info.ok());
  assert(not_info.status().IsInvalid());

  ServerFrame error;
  error.set_type("error");
  error.set_message("upload session expired");
  (*error.mutable_data()->mutable_fields())["code"].set_string_value("expired");
  const auto rejected = ParseSessionInfo(error);
  assert(!rejected.ok());
  assert(rejected.status().message().find("expired") != std::string::npos);
}

void TestUnreachableServerReportsError() {
  // nothing listens on port 1
  UploadClient client(::grpc::CreateChannel("127.0.0.1:1", ::grpc::InsecureChannelCredentials()), "alice");

  const auto created = client.CreateSession("clip.mp4", 1024);
  assert(!created.ok());
  assert(created.status().IsIOError());

  const auto cancelled = client.CancelSession("token");
  assert(!cancelled.ok());
}

void TestMissingLocalFile() {
  UploadClient client(::grpc::CreateChannel("127.0.0.1:1", ::grpc::InsecureChannelCredentials()), "alice");

  const auto result = client.UploadFile("token", "/nonexistent/upload_manager_client_test.bin");
  assert(!result.ok());
}

} // namespace

int main() {
  TestParseSessionInfo();
  TestParseSessionInfoRejectsOtherFrames();
  TestUnreachableServerReportsError();
  TestMissingLocalFile();

  std::cout << "upload_manager_unit_upload_client: pass\n";
  return 0;
}
