#include "internal/db/postgres/pg_pool.hpp"

namespace codegraph::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (...) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("find_node", "SELECT id, label, properties FROM graph_nodes WHERE id=$1");

  conn.prepare("insert_node", "INSERT INTO graph_nodes(id,label,properties) VALUES($1,$2,$3)");

  conn.prepare("update_node", "UPDATE graph_nodes SET label=$2, properties=$3 WHERE id=$1");

  conn.prepare("insert_edge_if_absent",
               "INSERT INTO graph_edges(from_id,to_id,type,kind,context,properties) VALUES($1,$2,$3,$4,$5,$6) "
               "ON CONFLICT(from_id,to_id,type,kind,context) DO NOTHING");

  conn.prepare("insert_audit",
               "INSERT INTO upsert_audit(id,operation_id,node_id,node_kind,operation_type,old_value,new_value,timestamp,source,processing_time_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) RETURNING seq");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (!conn->is_open()) {
      --live_connections_;
      delete conn;
      cv_.notify_one();
      return;
    }
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace codegraph::db::postgres
