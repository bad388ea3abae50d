#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/graph_repository.hpp"
#include "internal/model/edge.hpp"
#include "internal/model/node.hpp"
#include "internal/model/upsert_mode.hpp"
#include "internal/upsert/node_comparator.hpp"
#include "internal/upsert/upsert_result.hpp"
#include "internal/upsert/upsert_statistics.hpp"

namespace codegraph::upsert {

struct UpsertOptions {
  model::UpsertMode      mode             = model::UpsertMode::kUpsert;
  bool                   audit_enabled    = false;
  std::string            source           = "codegraph";
  model::AttributePolicy attribute_policy = model::AttributePolicy::kFirstSeen;
};

struct EdgeWriteResult {
  std::size_t created  = 0;
  std::size_t existing = 0;
};

/*
  Reconciles incoming nodes against the persisted graph.

  Per node: lookup, compare, then INSERT / UPDATE / SKIP inside the
  caller's transaction, plus an audit record for every write when
  auditing is on.

  Expected per-node conditions (invalid id, NotFound in update_only,
  AlreadyExists in insert_only, kind Conflict) become failed results
  and never stop the batch. A gateway failure (read throws, write
  returns non-OK, commit fails) rolls the batch transaction back and
  throws util::PersistenceFailure.
*/
class UpsertEngine {
 public:
  UpsertEngine(std::shared_ptr<db::GraphRepository> repository, std::shared_ptr<UpsertStatistics> statistics, UpsertOptions options = {});

  // One transaction, committed before returning; one result per node,
  // in input order, all tagged with a fresh operation id.
  std::vector<UpsertResult> UpsertBatch(const std::vector<model::EntityNode>& nodes);

  // Runs inside `tx`; the caller commits. Statistics are recorded by the
  // caller through RecordStatistics once the commit succeeded.
  std::vector<UpsertResult> UpsertBatch(db::Transaction& tx, const std::vector<model::EntityNode>& nodes, const std::string& operation_id);

  UpsertResult UpsertNode(const model::EntityNode& node);

  // Create-if-absent per edge in one committed transaction.
  EdgeWriteResult UpsertEdges(const std::vector<model::RelationshipEdge>& edges);

  EdgeWriteResult UpsertEdges(db::Transaction& tx, const std::vector<model::RelationshipEdge>& edges);

  // "upsert_<unix-ms>_<seq>", unique per engine instance.
  std::string NextOperationId();

  void RecordStatistics(const std::vector<UpsertResult>& results);

  const UpsertOptions& Options() const {
    return options_;
  }

  const std::shared_ptr<UpsertStatistics>& Statistics() const {
    return statistics_;
  }

 private:
  UpsertResult Reconcile(db::Transaction& tx, const model::EntityNode& node, const std::string& operation_id);

  void Audit(db::Transaction& tx, const UpsertResult& result, std::optional<model::PropertyMap> old_value,
             std::optional<model::PropertyMap> new_value);

  std::shared_ptr<db::GraphRepository> repository_;
  std::shared_ptr<UpsertStatistics>    statistics_;
  UpsertOptions                        options_;
  std::atomic<std::uint64_t>           sequence_{0};
};

} // namespace codegraph::upsert
