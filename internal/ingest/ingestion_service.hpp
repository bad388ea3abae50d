#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "codegraph/ingest/v1/records.pb.h"
#include "config/config.pb.h"
#include "internal/analysis/compilation_unit.hpp"
#include "internal/analysis/relationship_analyzer.hpp"
#include "internal/ingest/ingestion_report.hpp"
#include "internal/model/upsert_mode.hpp"
#include "internal/upsert/upsert_engine.hpp"

namespace codegraph::ingest {

struct IngestionOptions {
  // 0 means one per hardware thread
  std::uint32_t          worker_threads      = 0;
  bool                   include_private     = false;
  bool                   include_tests       = false;
  // 0 means unlimited
  std::uint64_t          max_file_size_bytes = 0;
  model::AttributePolicy attribute_policy    = model::AttributePolicy::kFirstSeen;

  static IngestionOptions FromConfig(const codegraph::runtime::config::RuntimeConfig& config);
};

/*
  Runs one ingestion: records in, graph writes out.

    1. filter records (private members, test sources, oversized files)
    2. group into compilation units by file; repository, module and
       package records form a scope unit that goes first
    3. mint every id and register it
    4. analyze units in parallel
    5. write each unit's node batch in its own transaction, then, once
       every node batch has committed, each unit's edge batch

  Per-node failures land in the report. A persistence failure stops the
  run and escapes as util::PersistenceFailure.
*/
class IngestionService {
 public:
  IngestionService(std::shared_ptr<upsert::UpsertEngine> engine, IngestionOptions options);

  IngestionReport Ingest(const std::vector<v1::ParsedEntity>& records);

  // Filter step on its own; true when the record takes part in ingestion.
  bool Accepts(const v1::ParsedEntity& record) const;

 private:
  std::vector<analysis::AnalysisResult> AnalyzeUnits(const std::vector<analysis::CompilationUnit>& units,
                                                     const analysis::RelationshipAnalyzer& analyzer) const;

  std::shared_ptr<upsert::UpsertEngine> engine_;
  IngestionOptions                      options_;
};

// "/test/" path segment or a class name ending in "Test".
bool IsTestRecord(const v1::ParsedEntity& record);

bool IsPrivateRecord(const v1::ParsedEntity& record);

} // namespace codegraph::ingest
