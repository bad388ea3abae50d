#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using codegraph::config::ConfigLoader;
namespace util = codegraph::util;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "codegraph_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool RejectsYaml(const std::string& yaml) {
  try {
    ConfigLoader::LoadFromYamlString(yaml);
  } catch (const util::InvalidConfiguration&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "[%l] %v"
database:
  sqlite:
    path: "/var/lib/codegraph/graph.db"
    wal_mode: true
upsert:
  mode: insert_only
  audit_enabled: true
  source: "nightly-import"
  annotation_attribute_policy: last_seen
ingestion:
  worker_threads: 4
  include_private: true
  include_tests: false
  max_file_size_bytes: 1048576
observability:
  tracing_enabled: false
  otlp_endpoint: "localhost:4317"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/codegraph/graph.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.upsert().mode() == "insert_only");
  assert(config.upsert().audit_enabled());
  assert(config.upsert().source() == "nightly-import");
  assert(config.upsert().annotation_attribute_policy() == "last_seen");
  assert(config.ingestion().worker_threads() == 4);
  assert(config.ingestion().include_private());
  assert(!config.ingestion().include_tests());
  assert(config.ingestion().max_file_size_bytes() == 1048576u);
  assert(config.observability().otlp_endpoint() == "localhost:4317");
}

void TestEmptyDocumentUsesDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
  assert(config.upsert().mode().empty());
  assert(!config.upsert().audit_enabled());
  assert(config.ingestion().worker_threads() == 0);
}

void TestMemoryBackend() {
  auto config = ConfigLoader::LoadFromYamlString("database:\n  memory: {}\n");
  assert(config.database().has_memory());
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString("upsert:\n  source: \"2026\"\n");
  assert(config.upsert().source() == "2026");
}

void TestUnknownFieldsAreRejected() {
  assert(RejectsYaml("upsert:\n  mode: upsert\n  retries: 3\n"));
  assert(RejectsYaml("server:\n  bind_address: \"0.0.0.0:50051\"\n"));
}

void TestInvalidModeAndPolicyAreRejected() {
  assert(RejectsYaml("upsert:\n  mode: merge\n"));
  assert(RejectsYaml("upsert:\n  annotation_attribute_policy: newest\n"));

  // normalized before matching
  auto config = ConfigLoader::LoadFromYamlString("upsert:\n  mode: \" UPDATE_ONLY \"\n");
  assert(config.upsert().mode() == " UPDATE_ONLY ");
}

void TestBackendRequiresLocation() {
  assert(RejectsYaml("database:\n  sqlite:\n    wal_mode: true\n"));
  assert(RejectsYaml("database:\n  postgres:\n    max_connections: 4\n"));
}

void TestMalformedYamlIsRejected() {
  assert(RejectsYaml("upsert: [unclosed\n"));

  bool threw = false;
  try {
    ConfigLoader::LoadFromYaml((std::filesystem::temp_directory_path() / "codegraph_missing_config.yaml").string());
  } catch (const util::InvalidConfiguration&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestEmptyDocumentUsesDefaults();
  TestMemoryBackend();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestInvalidModeAndPolicyAreRejected();
  TestBackendRequiresLocation();
  TestMalformedYamlIsRejected();

  std::cout << "codegraph_unit_config_loader: pass\n";
  return 0;
}
