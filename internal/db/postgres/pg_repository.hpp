#pragma once

#include <exception>
#include <memory>

#include "internal/db/api/graph_repository.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_tx.hpp"

namespace codegraph::db::postgres {

class PgRepository final : public db::GraphRepository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  // CREATE TABLE IF NOT EXISTS for every graph table, in its own transaction.
  static void BootstrapSchema(PgPool& pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);
};

} // namespace codegraph::db::postgres
