#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using upload::observability::StringField;

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

struct Options {
  std::string config_path;
  // load, validate and print the effective config, then exit
  bool check_only = false;
};

std::optional<Options> ParseArgs(int argc, char** argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check-config") {
      options.check_only = true;
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_path = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && options.config_path.empty()) {
      options.config_path = arg;
    } else {
      return std::nullopt;
    }
  }
  if (options.config_path.empty()) {
    return std::nullopt;
  }
  return options;
}

std::string DatabaseBackend(const upload::runtime::config::RuntimeConfig& config) {
  if (config.database().has_sqlite()) return "sqlite:" + config.database().sqlite().path();
  if (config.database().has_postgres()) return "postgres";
  return "memory";
}

void ShutdownObservability() {
  upload::observability::ShutdownMetrics();
  upload::observability::ShutdownTracing();
  upload::observability::ShutdownLogging();
}

} // namespace

int main(int argc, char** argv) {
  const auto options = ParseArgs(argc, argv);
  if (!options) {
    std::cerr << "Usage: upload-manager [--check-config] [--config] <config.yaml>" << std::endl;
    return 1;
  }

  upload::runtime::config::RuntimeConfig config;
  try {
    config = upload::config::ConfigLoader::LoadFromYaml(options->config_path);
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  if (options->check_only) {
    std::cout << config.DebugString();
    return 0;
  }

  try {
    upload::observability::InitializeLogging(config);
    upload::observability::InitializeTracing(config);
    upload::observability::InitializeMetrics(config);

    auto app = upload::factory::Build(config);

    upload::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));

    // handlers go in before the port opens
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    UPLOAD_LOG_INFO("upload manager started", {StringField("bind_address", config.server().bind_address()),
                                               StringField("database", DatabaseBackend(config)),
                                               StringField("staging_root", config.storage().staging_root()),
                                               StringField("blob_root", config.storage().blob_root())});

    while (g_running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    UPLOAD_LOG_INFO("upload manager stopping");

    // streams first, then the workers that drain what they produced
    server.Stop();
    app.Shutdown();
  } catch (const std::exception& e) {
    UPLOAD_LOG_ERROR("fatal error", {StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  ShutdownObservability();
  return 0;
}
