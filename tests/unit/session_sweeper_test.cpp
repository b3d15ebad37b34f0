#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/maintenance/session_sweeper.hpp"
#include "internal/notify/completion_queue.hpp"
#include "internal/registry/session_registry.hpp"
#include "internal/storage/disk/disk_chunk_buffer.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace upload::manager::v1;
using upload::maintenance::SessionSweeper;
using upload::maintenance::SweeperOptions;

struct Fixture {
  std::filesystem::path                              root;
  std::shared_ptr<upload::registry::SessionRegistry> registry;
  std::shared_ptr<upload::storage::DiskChunkBuffer>  buffer;
  std::shared_ptr<upload::session::SessionTable>     sessions;

  Fixture(const std::string& name, std::chrono::milliseconds ttl) : root(std::filesystem::temp_directory_path() / name) {
    std::filesystem::remove_all(root);
    upload::registry::RegistryOptions options;
    options.ttl = ttl;
    registry    = std::make_shared<upload::registry::SessionRegistry>(std::make_shared<upload::db::memory::MemoryRepository>(), options);
    buffer      = std::make_shared<upload::storage::DiskChunkBuffer>(root / "staging", root / "blobs", registry, false);
    sessions    = std::make_shared<upload::session::SessionTable>(registry, buffer, std::make_shared<upload::notify::CompletionQueue>());
  }

  ~Fixture() {
    std::filesystem::remove_all(root);
  }

  void Stage(const upload::db::model::SessionRecord& session, uint32_t index) {
    buffer->Write(session, index, std::string(upload::storage::ExpectedChunkLength(session, index), 's'));
    registry->RecordChunk(session.token, index, "");
  }
};

void TestRunOnceExpiresAndPurges() {
  Fixture f("upload_manager_sweeper_once", std::chrono::milliseconds(30));

  const auto stale = f.registry->Create("alice", "a.mp4", 300, 100);
  f.Stage(stale, 0);
  assert(std::filesystem::exists(f.buffer->StagingPathFor(stale.token)));

  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  const auto fresh = f.registry->Create("alice", "b.mp4", 300, 100);

  SessionSweeper sweeper(f.sessions, SweeperOptions{std::chrono::seconds(60), std::chrono::hours(1)});
  sweeper.RunOnce();
  assert(sweeper.passes() == 1);

  assert(f.registry->Lookup(stale.token).status == SESSION_STATUS_EXPIRED);
  assert(!std::filesystem::exists(f.buffer->StagingPathFor(stale.token)));
  assert(f.registry->Lookup(fresh.token).status == SESSION_STATUS_ACTIVE);

  // a retention of zero purges every terminal row
  SessionSweeper purger(f.sessions, SweeperOptions{std::chrono::seconds(60), std::chrono::milliseconds(0)});
  purger.RunOnce();

  bool gone = false;
  try {
    f.registry->Lookup(stale.token);
  } catch (const upload::util::NotFound&) {
    gone = true;
  }
  assert(gone);
  assert(f.sessions->Compact() == 0);
}

void TestBackgroundLoop() {
  Fixture f("upload_manager_sweeper_loop", std::chrono::milliseconds(20));

  const auto session = f.registry->Create("alice", "a.mp4", 300, 100);
  f.Stage(session, 1);

  SessionSweeper sweeper(f.sessions, SweeperOptions{std::chrono::milliseconds(10), std::chrono::hours(1)});
  sweeper.Start();
  sweeper.Start();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::filesystem::exists(f.buffer->StagingPathFor(session.token)) && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  sweeper.Stop();
  sweeper.Stop();

  assert(sweeper.passes() >= 1);
  assert(!std::filesystem::exists(f.buffer->StagingPathFor(session.token)));
  assert(f.registry->Lookup(session.token).status == SESSION_STATUS_EXPIRED);
}

void TestStopReturnsPromptly() {
  Fixture f("upload_manager_sweeper_stop", std::chrono::hours(1));

  SessionSweeper sweeper(f.sessions, SweeperOptions{std::chrono::hours(1), std::chrono::hours(1)});
  sweeper.Start();

  const auto started = std::chrono::steady_clock::now();
  sweeper.Stop();
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
}

} // namespace

int main() {
  TestRunOnceExpiresAndPurges();
  TestBackgroundLoop();
  TestStopReturnsPromptly();

  std::cout << "upload_manager_unit_session_sweeper: pass\n";
  return 0;
}
