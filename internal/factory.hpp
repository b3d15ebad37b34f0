#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace upload::registry { class SessionRegistry; }
namespace upload::session { class SessionTable; }
namespace upload::channel { class ConnectionMultiplexer; }
namespace upload::storage { class ChunkBuffer; }
namespace upload::notify { class CompletionQueue; class CompletionWorker; }
namespace upload::maintenance { class SessionSweeper; }
namespace upload::service { class UploadService; }

namespace upload::factory {

/*
  Application

  Owns every long-lived object of the server. Workers are started by
  Build() and stopped by Shutdown() (or the destructor).
*/
struct Application {
  std::shared_ptr<db::Repository>                  repository;
  std::shared_ptr<registry::SessionRegistry>       registry;
  std::shared_ptr<storage::ChunkBuffer>            buffer;
  std::shared_ptr<notify::CompletionQueue>         completions;
  std::shared_ptr<session::SessionTable>           sessions;
  std::shared_ptr<channel::ConnectionMultiplexer>  multiplexer;
  std::shared_ptr<service::UploadService>          upload_service;

  std::shared_ptr<notify::CompletionWorker>    completion_worker;
  std::shared_ptr<maintenance::SessionSweeper> sweeper;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  Application() = default;
  Application(Application&&) = default;
  Application& operator=(Application&&) = default;
  ~Application();

  void Shutdown();
};

// Only place that knows the concrete repository types.
std::shared_ptr<db::Repository> BuildRepository(const upload::runtime::config::RuntimeConfig& config);

/*
  Build full application dependency graph.

  Sessions left in completing by a previous process are put back to
  active, and completion events a previous process never published are
  queued, before anything is served.
*/
Application Build(const upload::runtime::config::RuntimeConfig& config);

} // namespace upload::factory
