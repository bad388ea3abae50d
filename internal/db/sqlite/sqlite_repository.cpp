#include "internal/db/sqlite/sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/property_codec.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace codegraph::db::sqlite {

using codegraph::db::ErrorCode;
using codegraph::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
    return;
  }
  BindText(st, idx, s);
}

static void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static std::int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

// Reads treat a prepare failure as a backend failure.
static sqlite3_stmt* PrepareRead(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return st;
}

static void ThrowIfStepFailed(sqlite3* db, sqlite3_stmt* st, int rc) {
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    std::string msg = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("sqlite step: " + msg);
  }
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  db.Exec(sql::CREATE_GRAPH_NODES);
  db.Exec(sql::CREATE_GRAPH_NODES_LABEL_INDEX);
  db.Exec(sql::CREATE_GRAPH_EDGES);
  db.Exec(sql::CREATE_SQLITE_UPSERT_AUDIT);
  db.Exec(sql::CREATE_UPSERT_AUDIT_OPERATION_INDEX);
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Nodes
// ------------------------------------------------------------------

std::optional<StoredNode> SqliteRepository::FindNodeById(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto* st = PrepareRead(db, sql::SELECT_NODE);

  BindText(st, 1, id);

  int rc = sqlite3_step(st);
  ThrowIfStepFailed(db, st, rc);
  if (rc != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto node_id    = ColText(st, 0);
  auto label      = ColText(st, 1);
  auto properties = ColText(st, 2);
  sqlite3_finalize(st);

  auto kind = model::ParseNodeKind(label);
  if (!kind) {
    throw std::runtime_error("unknown node label '" + label + "' for " + node_id);
  }

  StoredNode node;
  node.id         = std::move(node_id);
  node.kind       = *kind;
  node.properties = sql::DecodeProperties(properties);
  return node;
}

Result SqliteRepository::InsertNode(Transaction& t, const StoredNode& node) {
  auto* db = TX(t).Handle();

  std::string properties;
  try {
    properties = sql::EncodeProperties(node.properties);
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql::INSERT_NODE, -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, node.id);
  BindText(st, 2, std::string(model::ToString(node.kind)));
  BindText(st, 3, properties);

  int rc       = sqlite3_step(st);
  int extended = sqlite3_extended_errcode(db);
  sqlite3_finalize(st);

  return Translate(db, rc == SQLITE_DONE ? rc : extended);
}

Result SqliteRepository::UpdateNode(Transaction& t, const StoredNode& node) {
  auto* db = TX(t).Handle();

  std::string properties;
  try {
    properties = sql::EncodeProperties(node.properties);
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql::UPDATE_NODE, -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, std::string(model::ToString(node.kind)));
  BindText(st, 2, properties);
  BindText(st, 3, node.id);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "node not found: " + node.id);
  }
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Edges
// ------------------------------------------------------------------

Result SqliteRepository::CreateEdgeIfAbsent(Transaction& t, const model::RelationshipEdge& edge, bool* created) {
  auto* db = TX(t).Handle();

  std::string properties;
  try {
    properties = sql::EncodeProperties(edge.properties);
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql::INSERT_EDGE_IF_ABSENT, -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, edge.from_id);
  BindText(st, 2, edge.to_id);
  BindText(st, 3, std::string(model::ToString(edge.type)));
  BindText(st, 4, edge.kind);
  BindText(st, 5, edge.context);
  BindText(st, 6, properties);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  if (rc == SQLITE_DONE && created) *created = sqlite3_changes(db) > 0;
  return Translate(db, rc);
}

std::vector<model::RelationshipEdge> SqliteRepository::ListEdges(Transaction& t, const std::string& from_id) {
  auto* db = TX(t).Handle();
  auto* st = PrepareRead(db, sql::SELECT_EDGES_FROM);

  BindText(st, 1, from_id);

  std::vector<std::pair<model::RelationshipEdge, std::string>> rows;
  int                                                          rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    model::RelationshipEdge edge;
    edge.from_id = ColText(st, 0);
    edge.to_id   = ColText(st, 1);
    edge.type    = model::ParseEdgeType(ColText(st, 2)).value_or(model::EdgeType::kUses);
    edge.kind    = ColText(st, 3);
    edge.context = ColText(st, 4);
    rows.emplace_back(std::move(edge), ColText(st, 5));
  }
  ThrowIfStepFailed(db, st, rc);
  sqlite3_finalize(st);

  std::vector<model::RelationshipEdge> out;
  out.reserve(rows.size());
  for (auto& [edge, properties] : rows) {
    edge.properties = sql::DecodeProperties(properties);
    out.push_back(std::move(edge));
  }
  return out;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result SqliteRepository::InsertAudit(Transaction& t, AuditRecord& record) {
  auto* db = TX(t).Handle();

  std::string old_value;
  std::string new_value;
  try {
    old_value = sql::EncodeSnapshot(record.old_value);
    new_value = sql::EncodeSnapshot(record.new_value);
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql::INSERT_AUDIT, -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, record.id);
  BindText(st, 2, record.operation_id);
  BindText(st, 3, record.node_id);
  BindText(st, 4, record.node_kind);
  BindText(st, 5, record.operation_type);
  BindOptionalText(st, 6, old_value);
  BindOptionalText(st, 7, new_value);
  BindText(st, 8, record.timestamp);
  BindText(st, 9, record.source);
  BindI64(st, 10, record.processing_time_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  if (rc == SQLITE_DONE) record.seq = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db));
  return Translate(db, rc);
}

std::vector<AuditRecord> SqliteRepository::ListAudits(Transaction& t, const std::string& operation_id) {
  auto* db = TX(t).Handle();
  auto* st = PrepareRead(db, sql::SELECT_AUDITS);

  BindText(st, 1, operation_id);
  BindText(st, 2, operation_id);

  std::vector<std::pair<AuditRecord, std::pair<std::string, std::string>>> rows;
  int                                                                      rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    AuditRecord r;
    r.seq                = ColI64(st, 0);
    r.id                 = ColText(st, 1);
    r.operation_id       = ColText(st, 2);
    r.node_id            = ColText(st, 3);
    r.node_kind          = ColText(st, 4);
    r.operation_type     = ColText(st, 5);
    r.timestamp          = ColText(st, 8);
    r.source             = ColText(st, 9);
    r.processing_time_ms = ColI64(st, 10);
    rows.emplace_back(std::move(r), std::make_pair(ColText(st, 6), ColText(st, 7)));
  }
  ThrowIfStepFailed(db, st, rc);
  sqlite3_finalize(st);

  std::vector<AuditRecord> out;
  out.reserve(rows.size());
  for (auto& [record, snapshots] : rows) {
    record.old_value = sql::DecodeSnapshot(snapshots.first);
    record.new_value = sql::DecodeSnapshot(snapshots.second);
    out.push_back(std::move(record));
  }
  return out;
}

// ------------------------------------------------------------------
// Statistics
// ------------------------------------------------------------------

GraphStatistics SqliteRepository::GetStatistics(Transaction& t) {
  auto* db = TX(t).Handle();

  GraphStatistics stats;

  auto* st = PrepareRead(db, sql::COUNT_NODES_BY_LABEL);
  int   rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    stats.nodes_by_label[ColText(st, 0)] = ColI64(st, 1);
  }
  ThrowIfStepFailed(db, st, rc);
  sqlite3_finalize(st);

  st = PrepareRead(db, sql::COUNT_EDGES_BY_TYPE);
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    stats.edges_by_type[ColText(st, 0)] = ColI64(st, 1);
  }
  ThrowIfStepFailed(db, st, rc);
  sqlite3_finalize(st);

  st = PrepareRead(db, sql::COUNT_AUDITS);
  rc = sqlite3_step(st);
  ThrowIfStepFailed(db, st, rc);
  if (rc == SQLITE_ROW) stats.audit_records = ColI64(st, 0);
  sqlite3_finalize(st);

  return stats;
}

} // namespace codegraph::db::sqlite
