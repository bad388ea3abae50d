#pragma once

#include <string>
#include <vector>

#include "codegraph/ingest/v1/records.pb.h"
#include "internal/model/edge.hpp"
#include "internal/model/node.hpp"

namespace codegraph::analysis {

// A parser record together with the node minted from it.
struct MintedEntity {
  ingest::v1::ParsedEntity record;
  model::EntityNode        node;
};

/*
  Everything declared in one source file.

  The scope unit (repository, module and package records) has an empty file_path
  and is written before any file unit.
*/
struct CompilationUnit {
  std::string               file_path;
  std::vector<MintedEntity> entities;
};

struct AnalysisResult {
  // Annotation nodes sighted in the unit, one per id, attributes merged.
  std::vector<model::EntityNode>       annotation_nodes;
  std::vector<model::RelationshipEdge> edges;
};

} // namespace codegraph::analysis
