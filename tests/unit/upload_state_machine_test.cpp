#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/notify/completion_queue.hpp"
#include "internal/registry/session_registry.hpp"
#include "internal/session/frames.hpp"
#include "internal/session/session_table.hpp"
#include "internal/session/upload_state_machine.hpp"
#include "internal/storage/disk/disk_chunk_buffer.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace upload::manager::v1;
using upload::db::model::SessionRecord;

bool TakeOne(std::atomic<int>& remaining) {
  int current = remaining.load();
  while (current > 0) {
    if (remaining.compare_exchange_weak(current, current - 1)) return true;
  }
  return false;
}

// Memory repository whose next catalog inserts or notified-flag writes fail.
class FaultyRepository final : public upload::db::Repository {
 public:
  using Transaction = upload::db::Transaction;
  using Result      = upload::db::Result;

  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }

  Result InsertSession(Transaction& tx, const SessionRecord& r) override {
    return inner_.InsertSession(tx, r);
  }
  std::optional<SessionRecord> GetSession(Transaction& tx, const std::string& token) override {
    return inner_.GetSession(tx, token);
  }
  Result UpdateSession(Transaction& tx, const SessionRecord& r) override {
    if (r.notified && TakeOne(failing_notified_writes)) {
      return Result::Err(upload::db::ErrorCode::IOError, "flag write lost");
    }
    return inner_.UpdateSession(tx, r);
  }
  Result DeleteSession(Transaction& tx, const std::string& token) override {
    return inner_.DeleteSession(tx, token);
  }
  std::vector<SessionRecord> ListSessionsByOwner(Transaction& tx, const std::string& owner) override {
    return inner_.ListSessionsByOwner(tx, owner);
  }
  std::vector<SessionRecord> ListSessionsByStatus(Transaction& tx, SessionStatus status) override {
    return inner_.ListSessionsByStatus(tx, status);
  }

  Result InsertChunk(Transaction& tx, const upload::db::model::ChunkRecord& r) override {
    return inner_.InsertChunk(tx, r);
  }
  std::optional<upload::db::model::ChunkRecord> GetChunk(Transaction& tx, const std::string& token, uint32_t index) override {
    return inner_.GetChunk(tx, token, index);
  }
  std::vector<uint32_t> ListChunkIndices(Transaction& tx, const std::string& token) override {
    return inner_.ListChunkIndices(tx, token);
  }

  Result InsertArtifact(Transaction& tx, const upload::db::model::ArtifactRecord& r) override {
    if (TakeOne(failing_artifact_inserts)) {
      return Result::Err(upload::db::ErrorCode::IOError, "catalog unavailable");
    }
    return inner_.InsertArtifact(tx, r);
  }
  std::optional<upload::db::model::ArtifactRecord> GetArtifact(Transaction& tx, const std::string& artifact_id) override {
    return inner_.GetArtifact(tx, artifact_id);
  }

  std::atomic<int> failing_artifact_inserts{0};
  std::atomic<int> failing_notified_writes{0};

 private:
  upload::db::memory::MemoryRepository inner_;
};

// Delegates to the disk buffer but fails the next N finalize calls.
class FlakyFinalizeBuffer final : public upload::storage::ChunkBuffer {
 public:
  explicit FlakyFinalizeBuffer(std::shared_ptr<upload::storage::DiskChunkBuffer> inner) : inner_(std::move(inner)) {
  }

  void Write(const SessionRecord& session, uint32_t chunk_index, std::string_view data) override {
    inner_->Write(session, chunk_index, data);
  }
  bool IsComplete(const std::string& token) override {
    return inner_->IsComplete(token);
  }
  std::filesystem::path Finalize(const SessionRecord& session) override {
    if (failures_remaining.load() > 0) {
      failures_remaining--;
      throw upload::util::StorageError("disk full");
    }
    return inner_->Finalize(session);
  }
  void Discard(const std::string& token) override {
    inner_->Discard(token);
  }
  std::filesystem::path ArtifactPathFor(const SessionRecord& session) const override {
    return inner_->ArtifactPathFor(session);
  }

  std::atomic<int> failures_remaining{0};

 private:
  std::shared_ptr<upload::storage::DiskChunkBuffer> inner_;
};

struct Fixture {
  std::filesystem::path                               root;
  std::shared_ptr<FaultyRepository>                   repository;
  std::shared_ptr<upload::registry::SessionRegistry>  registry;
  std::shared_ptr<upload::storage::DiskChunkBuffer>   disk;
  std::shared_ptr<FlakyFinalizeBuffer>                buffer;
  std::shared_ptr<upload::notify::CompletionQueue>    completions;
  std::unique_ptr<upload::session::SessionTable>      table;

  Fixture(const std::string& name, upload::registry::RegistryOptions options = {})
      : root(std::filesystem::temp_directory_path() / name) {
    std::filesystem::remove_all(root);
    repository  = std::make_shared<FaultyRepository>();
    registry    = std::make_shared<upload::registry::SessionRegistry>(repository, options);
    disk        = std::make_shared<upload::storage::DiskChunkBuffer>(root / "staging", root / "blobs", registry, false);
    buffer      = std::make_shared<FlakyFinalizeBuffer>(disk);
    completions = std::make_shared<upload::notify::CompletionQueue>();
    table       = std::make_unique<upload::session::SessionTable>(registry, buffer, completions,
                                                            upload::session::StateMachineOptions{.max_finalize_attempts = 2});
  }

  ~Fixture() {
    std::filesystem::remove_all(root);
  }
};

ClientFrame Chunk(const SessionRecord& session, uint32_t index) {
  ClientFrame frame;
  frame.set_type("chunk");
  frame.set_chunk_index(index);
  frame.set_chunk_data(std::string(upload::storage::ExpectedChunkLength(session, index), 'v'));
  return frame;
}

ClientFrame Filled(const SessionRecord& session, uint32_t index, char fill) {
  auto frame = Chunk(session, index);
  frame.set_chunk_data(std::string(frame.chunk_data().size(), fill));
  return frame;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

ClientFrame Cancel() {
  ClientFrame frame;
  frame.set_type("cancel");
  return frame;
}

const google::protobuf::Value& Field(const ServerFrame& frame, const std::string& key) {
  return frame.data().fields().at(key);
}

void AssertError(const ServerFrame& frame, const std::string& code, bool retryable, bool fatal) {
  assert(frame.type() == "error");
  assert(Field(frame, "code").string_value() == code);
  assert(Field(frame, "retryable").bool_value() == retryable);
  assert(Field(frame, "fatal").bool_value() == fatal);
  assert(!frame.message().empty());
}

void TestDescribeListsMissingChunks() {
  Fixture    f("upload_manager_state_machine_describe");
  const auto session = f.registry->Create("alice", "clip.mp4", 500, 100);
  auto       machine = f.table->Acquire(session.token);

  machine->Handle(Chunk(session, 1));
  machine->Handle(Chunk(session, 3));

  const auto info = machine->Describe();
  assert(info.type() == "session_info");
  assert(Field(info, "video_id").string_value() == session.artifact_id);
  assert(Field(info, "total_chunks").number_value() == 5);
  assert(Field(info, "received_chunks").number_value() == 2);
  assert(Field(info, "chunk_size").number_value() == 100);
  assert(Field(info, "status").string_value() == "active");

  const auto& missing = Field(info, "missing_chunks").list_value();
  assert(missing.values_size() == 3);
  assert(missing.values(0).number_value() == 0);
  assert(missing.values(1).number_value() == 2);
  assert(missing.values(2).number_value() == 4);
}

void TestProgressAndCompletionOnce() {
  Fixture    f("upload_manager_state_machine_complete");
  const auto session = f.registry->Create("alice", "clip.mov", 250, 100);
  auto       machine = f.table->Acquire(session.token);

  auto frames = machine->Handle(Chunk(session, 2));
  assert(frames.size() == 1);
  assert(frames[0].type() == "progress");
  assert(Field(frames[0], "chunk_index").number_value() == 2);
  assert(Field(frames[0], "received_chunks").number_value() == 1);

  machine->Handle(Chunk(session, 0));
  frames = machine->Handle(Chunk(session, 1));
  assert(frames.size() == 2);
  assert(frames[0].type() == "progress");
  assert(Field(frames[0], "progress").number_value() == 1.0);
  assert(frames[1].type() == "upload_complete");
  assert(Field(frames[1], "video_id").string_value() == session.artifact_id);
  assert(Field(frames[1], "size").number_value() == 250);

  const auto path = Field(frames[1], "path").string_value();
  assert(std::filesystem::file_size(path) == 250);

  // late duplicate: rejected, no second event
  frames = machine->Handle(Chunk(session, 1));
  assert(frames.size() == 1);
  AssertError(frames[0], "session_not_active", false, false);

  assert(f.completions->Size() == 1);
  auto event = f.completions->Next();
  assert(event.has_value());
  assert(event->artifact_id == session.artifact_id);
  assert(event->owner_id == "alice");
  assert(event->mime_type == "video/quicktime");
  assert(event->size_bytes == 250);
  assert(event->path == path);
  assert(f.registry->Lookup(session.token).notified);
}

void TestCancelMidUpload() {
  Fixture    f("upload_manager_state_machine_cancel");
  const auto session = f.registry->Create("alice", "clip.mp4", 1'000, 100);
  auto       machine = f.table->Acquire(session.token);

  for (uint32_t i = 0; i < 5; ++i) {
    machine->Handle(Chunk(session, i));
  }
  assert(std::filesystem::exists(f.disk->StagingPathFor(session.token)));

  auto frames = machine->Handle(Cancel());
  assert(frames.size() == 1);
  assert(frames[0].type() == "upload_cancelled");
  assert(Field(frames[0], "received_chunks").number_value() == 5);
  assert(!std::filesystem::exists(f.disk->StagingPathFor(session.token)));
  assert(f.registry->Lookup(session.token).status == SESSION_STATUS_CANCELLED);

  frames = machine->Handle(Chunk(session, 5));
  AssertError(frames[0], "session_not_active", false, false);
  assert(!std::filesystem::exists(f.disk->StagingPathFor(session.token)));

  frames = machine->Handle(Cancel());
  AssertError(frames[0], "session_not_active", false, false);

  // out-of-band cancel of a cancelled session is a no-op
  assert(machine->Cancel().status == SESSION_STATUS_CANCELLED);
  assert(f.completions->Size() == 0);
}

void TestFinalizeFailureThenRetry() {
  Fixture    f("upload_manager_state_machine_finalize_retry");
  const auto session = f.registry->Create("alice", "clip.mp4", 200, 100);
  auto       machine = f.table->Acquire(session.token);

  f.buffer->failures_remaining = 2;

  machine->Handle(Chunk(session, 0));
  auto frames = machine->Handle(Chunk(session, 1));
  assert(frames.size() == 2);
  AssertError(frames[1], "storage_error", true, false);
  assert(f.registry->Lookup(session.token).status == SESSION_STATUS_ACTIVE);

  // resending a chunk re-runs the completion check
  frames = machine->Handle(Chunk(session, 1));
  assert(frames.size() == 2);
  AssertError(frames[1], "storage_error", false, true);
  assert(f.registry->Lookup(session.token).finalize_failures == 2);
  assert(f.completions->Size() == 0);

  frames = machine->Handle(Chunk(session, 1));
  assert(frames.size() == 2);
  assert(frames[1].type() == "upload_complete");
  assert(f.registry->Lookup(session.token).status == SESSION_STATUS_COMPLETED);
  assert(f.completions->Size() == 1);
}

void TestCatalogFailureAfterPublishKeepsArtifact() {
  Fixture    f("upload_manager_state_machine_catalog_retry");
  const auto session = f.registry->Create("alice", "clip.mp4", 300, 100);
  auto       machine = f.table->Acquire(session.token);

  f.repository->failing_artifact_inserts = 1;

  machine->Handle(Filled(session, 0, 'A'));
  machine->Handle(Filled(session, 1, 'B'));
  auto frames = machine->Handle(Filled(session, 2, 'C'));
  assert(frames.size() == 2);
  AssertError(frames[1], "storage_error", true, false);
  assert(f.registry->Lookup(session.token).status == SESSION_STATUS_ACTIVE);

  // the rename happened before the catalog write failed
  const auto artifact = f.disk->ArtifactPathFor(session);
  const auto expected = std::string(100, 'A') + std::string(100, 'B') + std::string(100, 'C');
  assert(ReadFile(artifact) == expected);
  assert(!std::filesystem::exists(f.disk->StagingPathFor(session.token)));

  // a resent chunk only retries the registry side
  frames = machine->Handle(Filled(session, 2, 'C'));
  assert(frames.size() == 2);
  assert(frames[1].type() == "upload_complete");
  assert(Field(frames[1], "path").string_value() == artifact.string());
  assert(!std::filesystem::exists(f.disk->StagingPathFor(session.token)));
  assert(ReadFile(artifact) == expected);

  assert(f.registry->Lookup(session.token).status == SESSION_STATUS_COMPLETED);
  assert(f.registry->GetArtifact(session.artifact_id).has_value());
  assert(f.completions->Size() == 1);
}

void TestLostCompletionFlagIsRedeliveredOnResend() {
  Fixture    f("upload_manager_state_machine_flag_retry");
  const auto session = f.registry->Create("alice", "clip.mp4", 200, 100);
  auto       machine = f.table->Acquire(session.token);

  f.repository->failing_notified_writes = 1;

  machine->Handle(Chunk(session, 0));
  auto frames = machine->Handle(Chunk(session, 1));
  assert(frames.size() == 2);
  AssertError(frames[1], "storage_error", true, false);

  const auto stored = f.registry->Lookup(session.token);
  assert(stored.status == SESSION_STATUS_COMPLETED);
  assert(!stored.notified);
  assert(f.completions->Size() == 0);
  assert(f.registry->PendingCompletions().size() == 1);

  frames = machine->Handle(Chunk(session, 1));
  assert(frames.size() == 1);
  assert(frames[0].type() == "upload_complete");
  assert(f.completions->Size() == 1);
  assert(f.registry->Lookup(session.token).notified);
  assert(f.registry->PendingCompletions().empty());

  // exactly once
  frames = machine->Handle(Chunk(session, 1));
  AssertError(frames[0], "session_not_active", false, false);
  assert(f.table->PublishPendingCompletions() == 0);
  assert(f.completions->Size() == 1);

  auto event = f.completions->Next();
  assert(event.has_value());
  assert(event->artifact_id == session.artifact_id);
  assert(event->size_bytes == 200);
}

void TestPendingCompletionPublishedWithoutClient() {
  Fixture    f("upload_manager_state_machine_flag_sweep");
  const auto session = f.registry->Create("alice", "clip.webm", 200, 100);

  f.repository->failing_notified_writes = 1;
  {
    auto machine = f.table->Acquire(session.token);
    machine->Handle(Chunk(session, 0));
    machine->Handle(Chunk(session, 1));
  }
  assert(f.completions->Size() == 0);

  assert(f.table->PublishPendingCompletions() == 1);
  assert(f.completions->Size() == 1);
  assert(f.table->PublishPendingCompletions() == 0);

  auto frames = f.table->Acquire(session.token)->Handle(Chunk(session, 0));
  AssertError(frames[0], "session_not_active", false, false);
  assert(f.completions->Size() == 1);
  assert(f.completions->Next()->mime_type == "video/webm");
}

void TestRejectedMessages() {
  Fixture    f("upload_manager_state_machine_rejects");
  const auto session = f.registry->Create("alice", "clip.mp4", 300, 100);
  auto       machine = f.table->Acquire(session.token);

  ClientFrame ping;
  ping.set_type("ping");
  auto frames = machine->Handle(ping);
  AssertError(frames[0], "unknown_message_kind", false, false);

  auto short_chunk = Chunk(session, 0);
  short_chunk.set_chunk_data("abc");
  frames = machine->Handle(short_chunk);
  AssertError(frames[0], "chunk_size_mismatch", false, false);

  frames = machine->Handle(Chunk(session, 0));
  ClientFrame out_of_range;
  out_of_range.set_type("chunk");
  out_of_range.set_chunk_index(7);
  out_of_range.set_chunk_data(std::string(100, 'x'));
  frames = machine->Handle(out_of_range);
  AssertError(frames[0], "invalid_chunk_index", false, false);

  auto first = Chunk(session, 1);
  first.set_chunk_digest("d1");
  machine->Handle(first);
  auto conflicting = Chunk(session, 1);
  conflicting.set_chunk_digest("d2");
  frames = machine->Handle(conflicting);
  AssertError(frames[0], "chunk_digest_mismatch", false, false);

  // no rejected message changed the count
  assert(f.registry->Lookup(session.token).received_chunks == 2);
}

void TestExpiredSessionDiscardsStaging() {
  upload::registry::RegistryOptions options;
  options.ttl = std::chrono::milliseconds(30);

  Fixture    f("upload_manager_state_machine_expired", options);
  const auto session = f.registry->Create("alice", "clip.mp4", 300, 100);
  auto       machine = f.table->Acquire(session.token);

  machine->Handle(Chunk(session, 0));
  assert(std::filesystem::exists(f.disk->StagingPathFor(session.token)));

  std::this_thread::sleep_for(std::chrono::milliseconds(60));

  auto frames = machine->Handle(Chunk(session, 1));
  AssertError(frames[0], "expired", false, false);
  assert(!std::filesystem::exists(f.disk->StagingPathFor(session.token)));

  bool threw = false;
  try {
    machine->Describe();
  } catch (const upload::util::Expired&) {
    threw = true;
  }
  assert(threw);
}

void TestSessionTableSharesMachines() {
  Fixture    f("upload_manager_state_machine_table");
  const auto session = f.registry->Create("alice", "clip.mp4", 300, 100);

  auto a = f.table->Acquire(session.token);
  auto b = f.table->Acquire(session.token);
  assert(a.get() == b.get());

  a.reset();
  b.reset();
  assert(f.table->Compact() == 0);

  auto c = f.table->Acquire(session.token);
  assert(c != nullptr);
  assert(f.table->Compact() == 1);
}

void TestConcurrentChunksFinalizeOnce() {
  Fixture    f("upload_manager_state_machine_concurrent");
  const auto session = f.registry->Create("alice", "clip.mp4", 64 * 100, 100);

  std::vector<std::thread> senders;
  std::atomic<int>         completes{0};
  for (int s = 0; s < 4; ++s) {
    senders.emplace_back([&, s] {
      auto machine = f.table->Acquire(session.token);
      for (uint32_t i = s; i < 64; i += 2) {
        for (const auto& frame : machine->Handle(Chunk(session, i))) {
          if (frame.type() == "upload_complete") completes++;
        }
      }
    });
  }
  for (auto& sender : senders) sender.join();

  assert(completes.load() == 1);
  assert(f.completions->Size() == 1);
  assert(f.registry->Lookup(session.token).status == SESSION_STATUS_COMPLETED);
}

} // namespace

int main() {
  TestDescribeListsMissingChunks();
  TestProgressAndCompletionOnce();
  TestCancelMidUpload();
  TestFinalizeFailureThenRetry();
  TestCatalogFailureAfterPublishKeepsArtifact();
  TestLostCompletionFlagIsRedeliveredOnResend();
  TestPendingCompletionPublishedWithoutClient();
  TestRejectedMessages();
  TestExpiredSessionDiscardsStaging();
  TestSessionTableSharesMachines();
  TestConcurrentChunksFinalizeOnce();

  std::cout << "upload_manager_unit_upload_state_machine: pass\n";
  return 0;
}
