#include "internal/db/postgres/pg_repository.hpp"

#include <optional>
#include <stdexcept>

#include "internal/db/sql/property_codec.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace codegraph::db::postgres {

namespace {

std::optional<std::string> NullIfEmpty(std::string value) {
  if (value.empty()) return std::nullopt;
  return value;
}

std::string TextOrEmpty(const pqxx::field& field) {
  return field.is_null() ? std::string() : std::string(field.c_str());
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec(sql::CREATE_GRAPH_NODES);
  tx.exec(sql::CREATE_GRAPH_NODES_LABEL_INDEX);
  tx.exec(sql::CREATE_GRAPH_EDGES);
  tx.exec(sql::CREATE_POSTGRES_UPSERT_AUDIT);
  tx.exec(sql::CREATE_UPSERT_AUDIT_OPERATION_INDEX);

  tx.exec("SELECT id,label,properties FROM graph_nodes LIMIT 1;");
  tx.exec("SELECT from_id,to_id,type,kind,context,properties FROM graph_edges LIMIT 1;");
  tx.commit();
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Nodes
// ------------------------------------------------------------------

std::optional<StoredNode> PgRepository::FindNodeById(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("find_node", id);
  if (res.empty()) return std::nullopt;

  std::string label = res[0][1].c_str();
  auto        kind  = model::ParseNodeKind(label);
  if (!kind) {
    throw std::runtime_error("unknown node label '" + label + "' for " + id);
  }

  StoredNode node;
  node.id         = res[0][0].c_str();
  node.kind       = *kind;
  node.properties = sql::DecodeProperties(res[0][2].c_str());
  return node;
}

Result PgRepository::InsertNode(Transaction& t, const StoredNode& node) {
  try {
    TX(t).Work().exec_prepared("insert_node", node.id, std::string(model::ToString(node.kind)), sql::EncodeProperties(node.properties));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateNode(Transaction& t, const StoredNode& node) {
  try {
    auto res = TX(t).Work().exec_prepared("update_node", node.id, std::string(model::ToString(node.kind)), sql::EncodeProperties(node.properties));
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "node not found: " + node.id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Edges
// ------------------------------------------------------------------

Result PgRepository::CreateEdgeIfAbsent(Transaction& t, const model::RelationshipEdge& edge, bool* created) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_edge_if_absent", edge.from_id, edge.to_id, std::string(model::ToString(edge.type)), edge.kind,
                                          edge.context, sql::EncodeProperties(edge.properties));
    if (created) *created = res.affected_rows() > 0;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RelationshipEdge> PgRepository::ListEdges(Transaction& t, const std::string& from_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT from_id,to_id,type,kind,context,properties FROM graph_edges WHERE from_id=$1 ORDER BY ctid;", from_id);

  std::vector<model::RelationshipEdge> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::RelationshipEdge edge;
    edge.from_id    = row[0].c_str();
    edge.to_id      = row[1].c_str();
    edge.type       = model::ParseEdgeType(row[2].c_str()).value_or(model::EdgeType::kUses);
    edge.kind       = TextOrEmpty(row[3]);
    edge.context    = TextOrEmpty(row[4]);
    edge.properties = sql::DecodeProperties(row[5].c_str());
    out.push_back(std::move(edge));
  }
  return out;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result PgRepository::InsertAudit(Transaction& t, AuditRecord& record) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_audit", record.id, record.operation_id, record.node_id, record.node_kind,
                                          record.operation_type, NullIfEmpty(sql::EncodeSnapshot(record.old_value)),
                                          NullIfEmpty(sql::EncodeSnapshot(record.new_value)), record.timestamp, record.source,
                                          record.processing_time_ms);
    record.seq = res[0][0].as<std::int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<AuditRecord> PgRepository::ListAudits(Transaction& t, const std::string& operation_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT seq,id,operation_id,node_id,node_kind,operation_type,old_value,new_value,timestamp,source,processing_time_ms "
      "FROM upsert_audit WHERE ($1='' OR operation_id=$1) ORDER BY seq;",
      operation_id);

  std::vector<AuditRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    AuditRecord r;
    r.seq                = row[0].as<std::int64_t>();
    r.id                 = row[1].c_str();
    r.operation_id       = row[2].c_str();
    r.node_id            = row[3].c_str();
    r.node_kind          = row[4].c_str();
    r.operation_type     = row[5].c_str();
    r.old_value          = sql::DecodeSnapshot(TextOrEmpty(row[6]));
    r.new_value          = sql::DecodeSnapshot(TextOrEmpty(row[7]));
    r.timestamp          = row[8].c_str();
    r.source             = row[9].c_str();
    r.processing_time_ms = row[10].as<std::int64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Statistics
// ------------------------------------------------------------------

GraphStatistics PgRepository::GetStatistics(Transaction& t) {
  auto& work = TX(t).Work();

  GraphStatistics stats;
  for (const auto& row : work.exec(sql::COUNT_NODES_BY_LABEL)) {
    stats.nodes_by_label[row[0].c_str()] = row[1].as<std::int64_t>();
  }
  for (const auto& row : work.exec(sql::COUNT_EDGES_BY_TYPE)) {
    stats.edges_by_type[row[0].c_str()] = row[1].as<std::int64_t>();
  }
  auto audits         = work.exec(sql::COUNT_AUDITS);
  stats.audit_records = audits.empty() ? 0 : audits[0][0].as<std::int64_t>();
  return stats;
}

} // namespace codegraph::db::postgres
