#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace codegraph::ingest {

struct IngestionFailure {
  // node id, or the record name when no id could be minted
  std::string node_id;
  std::string message;
};

struct IngestionReport {
  std::size_t records_read     = 0;
  std::size_t records_filtered = 0;
  std::size_t duplicate_ids    = 0;
  std::size_t units            = 0;

  std::size_t nodes_inserted = 0;
  std::size_t nodes_updated  = 0;
  std::size_t nodes_skipped  = 0;
  std::size_t nodes_failed   = 0;

  std::size_t edges_created  = 0;
  std::size_t edges_existing = 0;
  // edges dropped because an endpoint failed to persist
  std::size_t edges_dropped  = 0;

  std::vector<IngestionFailure> failures;
  std::vector<std::string>      operation_ids;

  double elapsed_ms = 0;

  std::size_t NodesWritten() const {
    return nodes_inserted + nodes_updated;
  }
};

} // namespace codegraph::ingest
