#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/identity/node_id_validator.hpp"
#include "internal/identity/node_identifier.hpp"
#include "internal/ingest/record_reader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using codegraph::runtime::config::RuntimeConfig;

static void Usage() {
  std::cout << "Usage:\n"
            << "  codegraphctl [--config <config.yaml>] ingest <records.jsonl> [--failures]\n"
            << "  codegraphctl [--config <config.yaml>] stats\n"
            << "  codegraphctl check-id <node_id>\n";
}

static void Shutdown() {
  codegraph::observability::ShutdownTracing();
  codegraph::observability::ShutdownLogging();
}

static int RunIngest(const codegraph::factory::Application& app, const std::string& path, bool show_failures) {
  auto records = codegraph::ingest::RecordReader::ReadFile(path);
  auto report  = app.ingestion->Ingest(records);

  std::cout << "records: " << report.records_read << " (filtered " << report.records_filtered << ", duplicate ids " << report.duplicate_ids
            << ")\n"
            << "units: " << report.units << "\n"
            << "nodes: inserted=" << report.nodes_inserted << " updated=" << report.nodes_updated << " skipped=" << report.nodes_skipped
            << " failed=" << report.nodes_failed << "\n"
            << "edges: created=" << report.edges_created << " existing=" << report.edges_existing << " dropped=" << report.edges_dropped << "\n"
            << "elapsed_ms: " << report.elapsed_ms << "\n";

  if (show_failures) {
    for (const auto& failure : report.failures) {
      std::cout << "failure: " << failure.node_id << ": " << failure.message << "\n";
    }
  }
  return 0;
}

static int RunStats(const codegraph::factory::Application& app) {
  auto tx    = app.repository->Begin();
  auto stats = app.repository->GetStatistics(*tx);
  tx->Commit();

  std::cout << "nodes: " << stats.TotalNodes() << "\n";
  for (const auto& [label, count] : stats.nodes_by_label) {
    std::cout << "  " << label << ": " << count << "\n";
  }
  std::cout << "edges: " << stats.TotalEdges() << "\n";
  for (const auto& [type, count] : stats.edges_by_type) {
    std::cout << "  " << type << ": " << count << "\n";
  }
  std::cout << "audit records: " << stats.audit_records << "\n";
  return 0;
}

static int RunCheckId(const std::string& node_id) {
  auto kind = codegraph::identity::ExtractNodeKind(node_id);
  if (!kind) {
    std::cout << "kind: unknown\nvalid: false\n";
    return 0;
  }

  auto validation = codegraph::identity::ValidateStrict(node_id, *kind);
  auto risk       = codegraph::identity::AnalyzeCollisionRisk(node_id, *kind);

  std::cout << "kind: " << codegraph::model::ToString(*kind) << "\n"
            << "valid: " << (validation.valid ? "true" : "false") << "\n";
  if (!validation.message.empty()) std::cout << "message: " << validation.message << "\n";
  std::cout << "collision risk: " << codegraph::identity::ToString(risk.level) << " (" << risk.reason << ")\n";
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string cmd = args[0];

  // ------------------------------------------------------------
  // Commands without a store
  // ------------------------------------------------------------
  if (cmd == "check-id") {
    if (args.size() != 2) {
      Usage();
      return 1;
    }
    return RunCheckId(args[1]);
  }

  bool show_failures = false;
  if (cmd == "ingest") {
    if (args.size() < 2 || args.size() > 3 || (args.size() == 3 && args[2] != "--failures")) {
      Usage();
      return 1;
    }
    show_failures = args.size() == 3;
  } else if (cmd != "stats" || args.size() != 1) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    RuntimeConfig config;
    if (!config_path.empty()) {
      config = codegraph::config::ConfigLoader::LoadFromYaml(config_path);
    }

    codegraph::observability::InitializeLogging(config);
    codegraph::observability::InitializeTracing(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = codegraph::factory::Build(config);

    int rc = cmd == "ingest" ? RunIngest(app, args[1], show_failures) : RunStats(app);
    Shutdown();
    return rc;
  } catch (const std::exception& e) {
    CODEGRAPH_LOG_ERROR("Fatal error", {codegraph::observability::StringField("error", e.what())});
    Shutdown();
    return 2;
  }
}
