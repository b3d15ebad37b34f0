#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

#if UPLOAD_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if UPLOAD_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using upload::db::ErrorCode;
using upload::db::Repository;
using upload::db::memory::MemoryRepository;
using upload::db::model::ArtifactRecord;
using upload::db::model::ChunkRecord;
using upload::db::model::SessionRecord;
using namespace upload::manager::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  // optimistic backends reject the second of two overlapping writers at commit
  bool detects_write_conflicts = false;
};

SessionRecord MakeSession(const std::string& token, const std::string& owner, uint32_t total_chunks = 4) {
  const auto now = NowMs();
  return SessionRecord{
      .token           = token,
      .owner_id        = owner,
      .filename        = "clip.mp4",
      .file_size       = static_cast<uint64_t>(total_chunks) * 1024,
      .chunk_size      = 1024,
      .total_chunks    = total_chunks,
      .received_chunks = 0,
      .status          = SESSION_STATUS_ACTIVE,
      .created_at_ms   = now,
      .expires_at_ms   = now + 60'000,
      .completed_at_ms = 0,
      .updated_at_ms   = now,
      .artifact_id     = token + "-artifact",
      .artifact_path   = "",
      .notified        = false,
      .finalize_failures = 0,
      .version         = 1,
  };
}

// A failed statement poisons a postgres transaction, so expected
// failures run in a transaction of their own.
template <typename Fn>
upload::db::Result InIsolation(Repository& repo, Fn&& fn) {
  auto tx     = repo.Begin();
  auto result = fn(*tx);
  tx->Rollback();
  return result;
}

void VerifySessionLifecycle(Repository& repo, const std::string& prefix) {
  const auto token = prefix + "-life";
  auto       seed  = MakeSession(token, prefix + "-owner");
  {
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, seed));
    tx->Commit();
  }

  auto duplicate = InIsolation(repo, [&](upload::db::Transaction& tx) { return repo.InsertSession(tx, seed); });
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto tx = repo.Begin();

  auto read = repo.GetSession(*tx, token);
  assert(read.has_value());
  assert(read->owner_id == seed.owner_id);
  assert(read->file_size == seed.file_size);
  assert(read->total_chunks == 4);
  assert(read->status == SESSION_STATUS_ACTIVE);
  assert(read->expires_at_ms == seed.expires_at_ms);
  assert(!read->notified);

  read->received_chunks   = 4;
  read->status            = SESSION_STATUS_COMPLETED;
  read->completed_at_ms   = NowMs();
  read->artifact_path     = "/blobs/owner/" + seed.artifact_id + ".mp4";
  read->notified          = true;
  read->finalize_failures = 1;
  read->version           = 2;
  assert(repo.UpdateSession(*tx, *read));

  auto updated = repo.GetSession(*tx, token);
  assert(updated.has_value());
  assert(updated->status == SESSION_STATUS_COMPLETED);
  assert(updated->received_chunks == 4);
  assert(updated->artifact_path == read->artifact_path);
  assert(updated->completed_at_ms == read->completed_at_ms);
  assert(updated->notified);
  assert(updated->finalize_failures == 1);
  assert(updated->version == 2);

  auto missing = MakeSession(prefix + "-never-inserted", "nobody");
  auto result  = repo.UpdateSession(*tx, missing);
  assert(result.code == ErrorCode::NotFound);
  assert(!repo.GetSession(*tx, missing.token).has_value());

  tx->Commit();
}

void VerifyListings(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  const auto owner = prefix + "-lister";
  auto       a     = MakeSession(prefix + "-list-a", owner);
  auto       b     = MakeSession(prefix + "-list-b", owner);
  auto       c     = MakeSession(prefix + "-list-c", prefix + "-other");
  b.status         = SESSION_STATUS_COMPLETING;
  assert(repo.InsertSession(*tx, a));
  assert(repo.InsertSession(*tx, b));
  assert(repo.InsertSession(*tx, c));

  assert(repo.ListSessionsByOwner(*tx, owner).size() == 2);
  assert(repo.ListSessionsByOwner(*tx, prefix + "-nobody").empty());

  bool found_b = false;
  for (const auto& record : repo.ListSessionsByStatus(*tx, SESSION_STATUS_COMPLETING)) {
    assert(record.status == SESSION_STATUS_COMPLETING);
    found_b = found_b || record.token == b.token;
  }
  assert(found_b);

  tx->Commit();
}

void VerifyChunksAndCascade(Repository& repo, const std::string& prefix) {
  const auto token = prefix + "-chunks";
  {
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, MakeSession(token, prefix + "-owner", 8)));
    for (uint32_t index : {5u, 1u, 7u, 0u}) {
      ChunkRecord chunk{.token = token, .chunk_index = index, .digest = index == 1 ? "d1" : "", .received_at_ms = NowMs()};
      assert(repo.InsertChunk(*tx, chunk));
    }
    tx->Commit();
  }

  ChunkRecord again{.token = token, .chunk_index = 5, .digest = "", .received_at_ms = NowMs()};
  auto        duplicate = InIsolation(repo, [&](upload::db::Transaction& tx) { return repo.InsertChunk(tx, again); });
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto tx = repo.Begin();

  const auto indices = repo.ListChunkIndices(*tx, token);
  assert((indices == std::vector<uint32_t>{0, 1, 5, 7}));

  auto chunk = repo.GetChunk(*tx, token, 1);
  assert(chunk.has_value());
  assert(chunk->digest == "d1");
  assert(!repo.GetChunk(*tx, token, 2).has_value());

  assert(repo.DeleteSession(*tx, token));
  assert(!repo.GetSession(*tx, token).has_value());
  assert(repo.ListChunkIndices(*tx, token).empty());

  tx->Commit();
}

void VerifyArtifactCatalog(Repository& repo, const std::string& prefix) {
  const auto token = prefix + "-artifact-session";

  ArtifactRecord artifact{
      .artifact_id       = prefix + "-artifact",
      .owner_id          = prefix + "-owner",
      .original_filename = "Holiday.MOV",
      .path              = "/blobs/owner/a.mov",
      .size_bytes        = 4096,
      .mime_type         = "video/quicktime",
      .session_token     = token,
      .created_at_ms     = NowMs(),
  };
  {
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, MakeSession(token, prefix + "-owner")));
    assert(repo.InsertArtifact(*tx, artifact));
    tx->Commit();
  }

  auto duplicate = InIsolation(repo, [&](upload::db::Transaction& tx) { return repo.InsertArtifact(tx, artifact); });
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto tx   = repo.Begin();
  auto read = repo.GetArtifact(*tx, artifact.artifact_id);
  assert(read.has_value());
  assert(read->original_filename == "Holiday.MOV");
  assert(read->size_bytes == 4096);
  assert(read->mime_type == "video/quicktime");
  assert(read->session_token == token);

  assert(!repo.GetArtifact(*tx, prefix + "-no-artifact").has_value());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  const auto token = prefix + "-rollback";
  {
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, MakeSession(token, "owner")));
    tx->Rollback();
  }
  {
    // destroyed without commit
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, MakeSession(token, "owner")));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetSession(*check_tx, token).has_value());
  check_tx->Commit();
}

void VerifyWriteConflict(Repository& repo, const std::string& prefix, bool detects_write_conflicts) {
  if (!detects_write_conflicts) {
    return;
  }

  const auto token = prefix + "-conflict";
  {
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, MakeSession(token, "owner")));
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  auto r1 = repo.GetSession(*tx1, token);
  auto r2 = repo.GetSession(*tx2, token);
  assert(r1.has_value() && r2.has_value());

  r1->received_chunks = 1;
  r1->version         = 2;
  r2->received_chunks = 1;
  r2->version         = 2;

  assert(repo.UpdateSession(*tx1, *r1));
  tx1->Commit();

  assert(repo.UpdateSession(*tx2, *r2));
  bool conflicted = false;
  try {
    tx2->Commit();
  } catch (const upload::util::Conflict&) {
    conflicted = true;
  }
  assert(conflicted);

  auto verify_tx = repo.Begin();
  auto final     = repo.GetSession(*verify_tx, token);
  assert(final.has_value());
  assert(final->received_chunks == 1);
  verify_tx->Commit();
}

// Interleaved transactions over different sessions both commit.
void VerifyIndependentWriters(Repository& repo, const std::string& prefix, bool detects_write_conflicts) {
  if (!detects_write_conflicts) {
    return;
  }

  const auto a = prefix + "-independent-a";
  const auto b = prefix + "-independent-b";
  {
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, MakeSession(a, "owner-a")));
    assert(repo.InsertSession(*tx, MakeSession(b, "owner-b")));
    tx->Commit();
  }

  auto tx_a = repo.Begin();
  auto tx_b = repo.Begin();

  auto ra = repo.GetSession(*tx_a, a);
  auto rb = repo.GetSession(*tx_b, b);
  assert(ra.has_value() && rb.has_value());

  assert(repo.InsertChunk(*tx_a, ChunkRecord{.token = a, .chunk_index = 0, .digest = "", .received_at_ms = NowMs()}));
  ra->received_chunks = 1;
  assert(repo.UpdateSession(*tx_a, *ra));

  assert(repo.InsertChunk(*tx_b, ChunkRecord{.token = b, .chunk_index = 3, .digest = "", .received_at_ms = NowMs()}));
  rb->received_chunks = 1;
  assert(repo.UpdateSession(*tx_b, *rb));

  tx_b->Commit();
  tx_a->Commit();

  auto verify_tx = repo.Begin();
  assert(repo.GetSession(*verify_tx, a)->received_chunks == 1);
  assert(repo.GetSession(*verify_tx, b)->received_chunks == 1);
  assert((repo.ListChunkIndices(*verify_tx, a) == std::vector<uint32_t>{0}));
  assert((repo.ListChunkIndices(*verify_tx, b) == std::vector<uint32_t>{3}));
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  const auto token = prefix + "-durable";
  auto       repo  = backend.make_repository();
  {
    auto tx      = repo->Begin();
    auto session = MakeSession(token, "owner", 3);
    assert(repo->InsertSession(*tx, session));
    assert(repo->InsertChunk(*tx, ChunkRecord{.token = token, .chunk_index = 2, .digest = "x", .received_at_ms = NowMs()}));
    session.received_chunks = 1;
    session.version         = 2;
    assert(repo->UpdateSession(*tx, session));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto s  = repo->GetSession(*tx, token);
  assert(s.has_value());
  assert(s->received_chunks == 1);
  assert(s->version == 2);
  assert((repo->ListChunkIndices(*tx, token) == std::vector<uint32_t>{2}));
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                    = "memory",
      .make_repository         = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart        = []() { return false; },
      .restart                 = [](std::shared_ptr<Repository>&) {},
      .cleanup                 = []() {},
      .detects_write_conflicts = true,
  };
}

#if UPLOAD_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("upload_manager_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<upload::db::sqlite::SqliteDB>(db_path);
    upload::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<upload::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      // one writer at a time; a second Begin() waits instead of racing
      .detects_write_conflicts = false,
  };
}
#endif

#if UPLOAD_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("UPLOAD_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("UPLOAD_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<upload::db::postgres::PgPool>(conninfo);
    pool->BootstrapSchema();
    return std::make_shared<upload::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                    = "postgres",
      .make_repository         = make_repo,
      .supports_restart        = []() { return true; },
      .restart                 = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                 = []() {},
      .detects_write_conflicts = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // postgres keeps rows across runs
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifySessionLifecycle(*repo, prefix);
  VerifyListings(*repo, prefix);
  VerifyChunksAndCascade(*repo, prefix);
  VerifyArtifactCatalog(*repo, prefix);
  VerifyRollbackBehavior(*repo, prefix);
  VerifyWriteConflict(*repo, prefix, backend.detects_write_conflicts);
  VerifyIndependentWriters(*repo, prefix, backend.detects_write_conflicts);

  repo.reset();
  VerifyRestartDurability(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if UPLOAD_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if UPLOAD_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "upload_manager_integration_repository_parity: pass\n";
  return 0;
}
