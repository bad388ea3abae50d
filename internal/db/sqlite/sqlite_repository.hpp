#pragma once

#include <memory>

#include "internal/db/api/graph_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"

namespace codegraph::db::sqlite {

class SqliteRepository final : public db::GraphRepository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // CREATE TABLE IF NOT EXISTS for every graph table.
  static void BootstrapSchema(SqliteDB& db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace codegraph::db::sqlite
