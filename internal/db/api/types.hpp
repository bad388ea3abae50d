#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "internal/model/node_kind.hpp"
#include "internal/model/property_value.hpp"

namespace codegraph::db {

// A node as the store holds it: label plus snake_case properties.
struct StoredNode {
  std::string        id;
  model::NodeKind    kind = model::NodeKind::kClass;
  model::PropertyMap properties;
};

/*
  Write-once trace of one INSERT or UPDATE.

  `seq` is assigned by the store on insert; `id` is the deterministic
  audit id and is not unique across operations on the same node.
*/
struct AuditRecord {
  std::int64_t                      seq = 0;
  std::string                       id;
  std::string                       operation_id;
  std::string                       node_id;
  std::string                       node_kind;
  std::string                       operation_type;
  std::optional<model::PropertyMap> old_value;
  std::optional<model::PropertyMap> new_value;
  std::string                       timestamp;
  std::string                       source;
  std::int64_t                      processing_time_ms = 0;
};

struct GraphStatistics {
  std::map<std::string, std::int64_t> nodes_by_label;
  std::map<std::string, std::int64_t> edges_by_type;
  std::int64_t                        audit_records = 0;

  std::int64_t TotalNodes() const {
    std::int64_t total = 0;
    for (const auto& [label, count] : nodes_by_label) total += count;
    return total;
  }

  std::int64_t TotalEdges() const {
    std::int64_t total = 0;
    for (const auto& [type, count] : edges_by_type) total += count;
    return total;
  }
};

} // namespace codegraph::db
