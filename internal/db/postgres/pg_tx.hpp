#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "internal/db/postgres/pg_pool.hpp"

namespace codegraph::db::postgres {

/*
  pqxx::work on a pooled connection.

  Runs at SERIALIZABLE isolation so lookup + compare + write of one node
  cannot lose an update to a concurrent ingestion; the loser's commit
  fails and the batch surfaces a persistence failure.
*/
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction() override;

  pqxx::work& Work() {
    return *tx_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return finished_;
  }

 private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       tx_;
  bool                              finished_ = false;
};

} // namespace codegraph::db::postgres
