#include "internal/config/config_loader.hpp"
#include "internal/observability/spans.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using upload::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "upload_manager_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:7000"
database:
  sqlite:
    path: "/tmp/upload-sessions.db"
storage:
  staging_root: "/tmp/upload-test/staging"
  blob_root: "/tmp/upload-test/blobs"
  fsync: true
sessions:
  ttl: "3600s"
  retention: "7200s"
  sweep_interval: "5s"
  default_chunk_size: 524288
  max_chunk_size: 1048576
  owner_quota_bytes: 1073741824
  max_finalize_attempts: 3
channel:
  malformed_message_threshold: 4
logging:
  level: "debug"
  file: "/tmp/upload-test/upload-manager.log"
observability:
  tracing_enabled: false
  transport: "OTLP_TRANSPORT_HTTP"
  service_name: "uploads-eu"
  trace_sample_ratio: 0.25
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/upload-sessions.db");
  assert(config.storage().fsync());
  assert(config.sessions().ttl().seconds() == 3600);
  assert(config.sessions().retention().seconds() == 7200);
  assert(config.sessions().sweep_interval().seconds() == 5);
  assert(config.sessions().default_chunk_size() == 524288);
  assert(config.sessions().owner_quota_bytes() == 1073741824ULL);
  assert(config.sessions().max_finalize_attempts() == 3);
  assert(config.channel().malformed_message_threshold() == 4);
  assert(config.logging().level() == "debug");
  assert(config.observability().transport() == upload::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.logging().file() == "/tmp/upload-test/upload-manager.log");

  const auto otlp = upload::observability::ToOtlpConfig(config);
  assert(otlp.service_name == "uploads-eu");
  assert(otlp.sample_ratio == 0.25);
  assert(otlp.transport == upload::observability::OtlpTransport::kHttpProtobuf);
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");

  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_memory());
  assert(config.sessions().ttl().seconds() == 86400);
  assert(config.sessions().retention().seconds() == 604800);
  assert(config.sessions().sweep_interval().seconds() == 60);
  assert(config.sessions().default_chunk_size() == 1024 * 1024);
  assert(config.sessions().max_chunk_size() == 16 * 1024 * 1024);
  assert(config.sessions().max_finalize_attempts() == 2);
  assert(config.channel().malformed_message_threshold() == 8);
  assert(config.logging().level() == "info");
  assert(config.storage().staging_root() != config.storage().blob_root());
}

void TestPostgresPoolSizeDefaults() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://localhost/uploads"
)");
  assert(config.database().has_postgres());
  assert(config.database().postgres().max_connections() == 4);
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "12345"
)");
  assert(config.database().sqlite().path() == "12345");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects(R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)"));
}

void TestInvalidValuesAreRejected() {
  assert(Rejects(R"(sessions:
  default_chunk_size: 4194304
  max_chunk_size: 1048576
)"));

  assert(Rejects(R"(sessions:
  ttl: "-5s"
)"));

  assert(Rejects(R"(database:
  sqlite:
    path: ""
)"));

  assert(Rejects(R"(storage:
  staging_root: "/tmp/same"
  blob_root: "/tmp/same"
)"));

  assert(Rejects(R"(observability:
  trace_sample_ratio: 1.5
)"));

  assert(Rejects("server: [unbalanced"));
}

void TestOtlpEndpointResolution() {
  ::unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");

  upload::observability::OtlpConfig otlp;
  otlp.transport = upload::observability::OtlpTransport::kHttpProtobuf;
  assert(upload::observability::ResolveOtlpEndpoint(otlp, "traces") == "http://localhost:4318/v1/traces");
  assert(upload::observability::ResolveOtlpEndpoint(otlp, "metrics") == "http://localhost:4318/v1/metrics");

  ::setenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "http://collector:4318/v1/metrics", 1);
  assert(upload::observability::ResolveOtlpEndpoint(otlp, "metrics") == "http://collector:4318/v1/metrics");
  assert(upload::observability::ResolveOtlpEndpoint(otlp, "traces") == "http://localhost:4318/v1/traces");
  ::unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");

  otlp.transport = upload::observability::OtlpTransport::kGrpc;
  assert(upload::observability::ResolveOtlpEndpoint(otlp, "traces") == "localhost:4317");
  otlp.endpoint = "otel.internal:4317";
  assert(upload::observability::ResolveOtlpEndpoint(otlp, "metrics") == "otel.internal:4317");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/upload-manager.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must report unreadable files.");
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestEmptyDocumentYieldsDefaults();
  TestPostgresPoolSizeDefaults();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestOtlpEndpointResolution();
  TestMissingFileIsReported();

  std::cout << "upload_manager_unit_config_loader: pass\n";
  return 0;
}
