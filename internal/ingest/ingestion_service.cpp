#include "internal/ingest/ingestion_service.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <thread>
#include <unordered_set>

#include "internal/analysis/entity_factory.hpp"
#include "internal/analysis/id_registry.hpp"
#include "internal/identity/node_identifier.hpp"
#include "internal/ingest/analysis_scheduler.hpp"
#include "internal/ingest/analysis_worker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace codegraph::ingest {

using v1::ParsedEntity;

namespace {

bool IsScopeRecord(const ParsedEntity& record) {
  switch (record.kind()) {
    case v1::ENTITY_KIND_REPOSITORY:
    case v1::ENTITY_KIND_MODULE:
    case v1::ENTITY_KIND_PACKAGE:
      return true;
    default:
      return false;
  }
}

const std::string& ClassNameOf(const ParsedEntity& record) {
  return record.kind() == v1::ENTITY_KIND_CLASS ? record.name() : record.declaring_class();
}

} // namespace

IngestionOptions IngestionOptions::FromConfig(const codegraph::runtime::config::RuntimeConfig& config) {
  IngestionOptions options;
  options.worker_threads      = config.ingestion().worker_threads();
  options.include_private     = config.ingestion().include_private();
  options.include_tests       = config.ingestion().include_tests();
  options.max_file_size_bytes = config.ingestion().max_file_size_bytes();
  options.attribute_policy    = model::ParseAttributePolicy(config.upsert().annotation_attribute_policy());
  return options;
}

bool IsTestRecord(const ParsedEntity& record) {
  auto path = "/" + identity::NormalizeFilePath(record.file_path());
  if (path.find("/test/") != std::string::npos) return true;

  auto name = util::Trim(ClassNameOf(record));
  return name.ends_with("Test");
}

bool IsPrivateRecord(const ParsedEntity& record) {
  if (!record.visibility().empty()) return util::ToLower(util::Trim(record.visibility())) == "private";
  return std::find(record.modifiers().begin(), record.modifiers().end(), "private") != record.modifiers().end();
}

IngestionService::IngestionService(std::shared_ptr<upsert::UpsertEngine> engine, IngestionOptions options)
    : engine_(std::move(engine)), options_(options) {
  if (!engine_) {
    throw util::InvalidArgument("upsert engine cannot be null");
  }
}

bool IngestionService::Accepts(const ParsedEntity& record) const {
  if (IsScopeRecord(record)) return true;
  if (!options_.include_private && IsPrivateRecord(record)) return false;
  if (!options_.include_tests && IsTestRecord(record)) return false;
  if (options_.max_file_size_bytes > 0 && record.file_size_bytes() > 0 &&
      static_cast<std::uint64_t>(record.file_size_bytes()) > options_.max_file_size_bytes) {
    return false;
  }
  return true;
}

IngestionReport IngestionService::Ingest(const std::vector<ParsedEntity>& records) {
  observability::SpanScope span("codegraph.ingest");
  span.SetAttribute("records", static_cast<std::int64_t>(records.size()));

  const auto started = std::chrono::steady_clock::now();

  IngestionReport report;
  report.records_read = records.size();

  // -------------------------------------------------------------------
  // Filter, group and mint
  // -------------------------------------------------------------------
  analysis::EntityFactory                          factory;
  analysis::IdRegistry                             registry;
  analysis::CompilationUnit                        scope;
  std::map<std::string, analysis::CompilationUnit> files;

  for (const auto& record : records) {
    if (!Accepts(record)) {
      ++report.records_filtered;
      continue;
    }

    model::EntityNode node;
    try {
      node = factory.Create(record);
    } catch (const util::InvalidArgument& e) {
      ++report.nodes_failed;
      report.failures.push_back({record.name(), e.what()});
      CODEGRAPH_LOG_WARN("Record rejected", {observability::StringField("name", record.name()), observability::StringField("error", e.what())});
      continue;
    }

    if (registry.Contains(model::IdOf(node))) {
      ++report.duplicate_ids;
      continue;
    }
    registry.Register(node);

    if (IsScopeRecord(record)) {
      scope.entities.push_back({record, std::move(node)});
    } else {
      auto& unit     = files[record.file_path()];
      unit.file_path = record.file_path();
      unit.entities.push_back({record, std::move(node)});
    }
  }

  std::vector<analysis::CompilationUnit> units;
  units.reserve(files.size() + 1);
  if (!scope.entities.empty()) units.push_back(std::move(scope));
  for (auto& [path, unit] : files) {
    units.push_back(std::move(unit));
  }
  report.units = units.size();

  // -------------------------------------------------------------------
  // Analyze
  // -------------------------------------------------------------------
  analysis::RelationshipAnalyzer analyzer(registry, options_.attribute_policy);
  auto                           analyses = AnalyzeUnits(units, analyzer);

  // -------------------------------------------------------------------
  // Phase 1: node batches
  // -------------------------------------------------------------------
  std::unordered_set<std::string> failed_ids;

  for (std::size_t i = 0; i < units.size(); ++i) {
    std::vector<model::EntityNode> batch;
    batch.reserve(units[i].entities.size() + analyses[i].annotation_nodes.size());
    for (const auto& entity : units[i].entities) {
      batch.push_back(entity.node);
    }
    for (const auto& annotation : analyses[i].annotation_nodes) {
      batch.push_back(annotation);
    }
    if (batch.empty()) continue;

    auto results = engine_->UpsertBatch(batch);
    if (!results.empty()) report.operation_ids.push_back(results.front().operation_id);

    for (const auto& result : results) {
      if (!result.success) {
        ++report.nodes_failed;
        failed_ids.insert(result.node_id);
        report.failures.push_back({result.node_id, result.error_message});
        continue;
      }
      switch (result.operation_type) {
        case upsert::OperationType::kInsert:
          ++report.nodes_inserted;
          break;
        case upsert::OperationType::kUpdate:
          ++report.nodes_updated;
          break;
        case upsert::OperationType::kSkip:
          ++report.nodes_skipped;
          break;
      }
    }
  }

  // -------------------------------------------------------------------
  // Phase 2: edge batches
  // -------------------------------------------------------------------
  for (auto& analysis : analyses) {
    std::vector<model::RelationshipEdge> edges;
    edges.reserve(analysis.edges.size());
    for (auto& edge : analysis.edges) {
      if (failed_ids.contains(edge.from_id) || failed_ids.contains(edge.to_id)) {
        ++report.edges_dropped;
        continue;
      }
      edges.push_back(std::move(edge));
    }
    if (edges.empty()) continue;

    auto written = engine_->UpsertEdges(edges);
    report.edges_created += written.created;
    report.edges_existing += written.existing;
  }

  report.elapsed_ms = util::ElapsedMs(started);

  CODEGRAPH_LOG_INFO("Ingestion completed",
                     {observability::IntField("records", static_cast<std::int64_t>(report.records_read)),
                      observability::IntField("filtered", static_cast<std::int64_t>(report.records_filtered)),
                      observability::IntField("units", static_cast<std::int64_t>(report.units)),
                      observability::IntField("inserted", static_cast<std::int64_t>(report.nodes_inserted)),
                      observability::IntField("updated", static_cast<std::int64_t>(report.nodes_updated)),
                      observability::IntField("skipped", static_cast<std::int64_t>(report.nodes_skipped)),
                      observability::IntField("failed", static_cast<std::int64_t>(report.nodes_failed)),
                      observability::IntField("edges_created", static_cast<std::int64_t>(report.edges_created)),
                      observability::IntField("elapsed_ms", static_cast<std::int64_t>(report.elapsed_ms))});
  return report;
}

std::vector<analysis::AnalysisResult> IngestionService::AnalyzeUnits(const std::vector<analysis::CompilationUnit>& units,
                                                                     const analysis::RelationshipAnalyzer&  analyzer) const {
  std::vector<AnalysisSlot> slots(units.size());

  std::size_t threads = options_.worker_threads > 0 ? options_.worker_threads : std::thread::hardware_concurrency();
  threads             = std::max<std::size_t>(1, std::min(threads, units.size()));

  auto scheduler = std::make_shared<AnalysisScheduler>();
  for (std::size_t i = 0; i < units.size(); ++i) {
    scheduler->Enqueue(AnalysisTask{&units[i], i});
  }

  {
    std::vector<std::unique_ptr<AnalysisWorker>> workers;
    workers.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
      workers.push_back(std::make_unique<AnalysisWorker>(scheduler, analyzer, slots));
      workers.back()->Start();
    }
    for (auto& worker : workers) {
      worker->Stop();
    }
  }

  std::vector<analysis::AnalysisResult> results;
  results.reserve(slots.size());
  for (auto& slot : slots) {
    if (slot.error) std::rethrow_exception(slot.error);
    results.push_back(std::move(slot.result));
  }
  return results;
}

} // namespace codegraph::ingest
