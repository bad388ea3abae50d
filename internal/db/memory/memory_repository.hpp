#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/db/api/graph_repository.hpp"

namespace codegraph::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::GraphRepository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  std::optional<StoredNode> FindNodeById(Transaction&, const std::string& id) override;
  Result                    InsertNode(Transaction&, const StoredNode& node) override;
  Result                    UpdateNode(Transaction&, const StoredNode& node) override;

  Result CreateEdgeIfAbsent(Transaction&, const model::RelationshipEdge& edge, bool* created) override;
  std::vector<model::RelationshipEdge> ListEdges(Transaction&, const std::string& from_id) override;

  Result                   InsertAudit(Transaction&, AuditRecord& record) override;
  std::vector<AuditRecord> ListAudits(Transaction&, const std::string& operation_id) override;

  GraphStatistics GetStatistics(Transaction&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, StoredNode> nodes;
    std::vector<model::RelationshipEdge>        edges;
    std::unordered_set<std::string>             edge_keys;
    std::vector<AuditRecord>                    audits;
    std::int64_t                                next_audit_seq = 1;
  };

  static MemoryTransaction& TX(Transaction& t);

  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

} // namespace codegraph::db::memory
