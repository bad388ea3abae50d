#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/model/edge.hpp"

namespace codegraph::db {

/*
  Graph persistence gateway.

  Every call runs inside a Transaction obtained from Begin() on the same
  repository. Writes report failures through Result; reads return
  nullopt / empty for "absent" and throw std::runtime_error when the
  backend itself fails.
*/
class GraphRepository {
 public:
  virtual ~GraphRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::optional<StoredNode> FindNodeById(Transaction&, const std::string& id) = 0;

  // AlreadyExists when the id is taken.
  virtual Result InsertNode(Transaction&, const StoredNode& node) = 0;

  // Replaces label and properties; NotFound when the id is absent.
  virtual Result UpdateNode(Transaction&, const StoredNode& node) = 0;

  // Keyed by (from, to, type, kind, context). `created` is false when an
  // identical edge already existed; its properties are left untouched.
  virtual Result CreateEdgeIfAbsent(Transaction&, const model::RelationshipEdge& edge, bool* created) = 0;

  // Outgoing edges of `from_id` in insertion order.
  virtual std::vector<model::RelationshipEdge> ListEdges(Transaction&, const std::string& from_id) = 0;

  // Assigns record.seq.
  virtual Result InsertAudit(Transaction&, AuditRecord& record) = 0;

  // Records of one operation in seq order; all records when empty.
  virtual std::vector<AuditRecord> ListAudits(Transaction&, const std::string& operation_id) = 0;

  virtual GraphStatistics GetStatistics(Transaction&) = 0;
};

} // namespace codegraph::db
