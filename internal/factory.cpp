#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/channel/connection_multiplexer.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/upload_server.hpp"
#include "internal/maintenance/session_sweeper.hpp"
#include "internal/notify/completion_queue.hpp"
#include "internal/notify/completion_worker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/session_registry.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/upload_service.hpp"
#include "internal/session/session_table.hpp"
#include "internal/storage/disk/disk_chunk_buffer.hpp"
#include "internal/util/time.hpp"
#if UPLOAD_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if UPLOAD_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace upload::factory {

using namespace upload;

std::shared_ptr<db::Repository> BuildRepository(const upload::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if UPLOAD_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if UPLOAD_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    pool->BootstrapSchema();
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const upload::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto& sessions_config = config.sessions();

  // ------------------------------------------------------------------
  // Registry
  // ------------------------------------------------------------------
  registry::RegistryOptions registry_options;
  registry_options.ttl               = util::DurationOr(sessions_config.ttl(), registry_options.ttl);
  registry_options.max_chunk_size    = sessions_config.max_chunk_size();
  registry_options.owner_quota_bytes = sessions_config.owner_quota_bytes();

  app.repository = BuildRepository(config);
  app.registry   = std::make_shared<registry::SessionRegistry>(app.repository, registry_options);

  if (const auto recovered = app.registry->RecoverInFlight(); recovered > 0) {
    UPLOAD_LOG_WARN("recovered sessions left mid-finalize", {observability::IntField("count", static_cast<int64_t>(recovered))});
  }

  // ------------------------------------------------------------------
  // Staging / completion
  // ------------------------------------------------------------------
  app.buffer = std::make_shared<storage::DiskChunkBuffer>(config.storage().staging_root(), config.storage().blob_root(), app.registry,
                                                          config.storage().fsync());
  app.completions       = std::make_shared<notify::CompletionQueue>();
  app.completion_worker = std::make_shared<notify::CompletionWorker>(app.completions, std::make_shared<notify::LoggingAnalysisDispatcher>());

  // ------------------------------------------------------------------
  // Sessions and channel
  // ------------------------------------------------------------------
  session::StateMachineOptions machine_options;
  machine_options.max_finalize_attempts = sessions_config.max_finalize_attempts();
  app.sessions = std::make_shared<session::SessionTable>(app.registry, app.buffer, app.completions, machine_options);
  app.sessions->PublishPendingCompletions();

  channel::MultiplexerOptions multiplexer_options;
  multiplexer_options.malformed_message_threshold = config.channel().malformed_message_threshold();
  app.multiplexer = std::make_shared<channel::ConnectionMultiplexer>(app.sessions, multiplexer_options);

  maintenance::SweeperOptions sweeper_options;
  sweeper_options.interval  = util::DurationOr(sessions_config.sweep_interval(), sweeper_options.interval);
  sweeper_options.retention = util::DurationOr(sessions_config.retention(), sweeper_options.retention);
  app.sweeper               = std::make_shared<maintenance::SessionSweeper>(app.sessions, sweeper_options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.registry           = app.registry;
  ctx.sessions           = app.sessions;
  ctx.multiplexer        = app.multiplexer;
  ctx.default_chunk_size = sessions_config.default_chunk_size();

  app.upload_service = std::make_shared<service::UploadService>(ctx);
  app.grpc_services.push_back(std::make_unique<grpc::UploadServer>(app.upload_service));

  app.completion_worker->Start();
  app.sweeper->Start();

  return app;
}

Application::~Application() {
  Shutdown();
}

void Application::Shutdown() {
  if (sweeper) sweeper->Stop();
  if (completion_worker) completion_worker->Stop();
}

} // namespace upload::factory
