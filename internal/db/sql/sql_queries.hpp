#pragma once

namespace codegraph::db::sql {

/*
  Canonical SQL.

  Schema statements are written in the subset both engines accept.
  Statement text uses '?' placeholders (SQLite); the postgres backend
  carries its own $n spellings of the same statements.
*/

// schema

static constexpr const char* CREATE_GRAPH_NODES =
    "CREATE TABLE IF NOT EXISTS graph_nodes ("
    " id TEXT PRIMARY KEY,"
    " label TEXT NOT NULL,"
    " properties TEXT NOT NULL);";

static constexpr const char* CREATE_GRAPH_NODES_LABEL_INDEX =
    "CREATE INDEX IF NOT EXISTS graph_nodes_label_idx ON graph_nodes(label);";

static constexpr const char* CREATE_GRAPH_EDGES =
    "CREATE TABLE IF NOT EXISTS graph_edges ("
    " from_id TEXT NOT NULL,"
    " to_id TEXT NOT NULL,"
    " type TEXT NOT NULL,"
    " kind TEXT NOT NULL DEFAULT '',"
    " context TEXT NOT NULL DEFAULT '',"
    " properties TEXT NOT NULL,"
    " UNIQUE(from_id, to_id, type, kind, context));";

static constexpr const char* CREATE_SQLITE_UPSERT_AUDIT =
    "CREATE TABLE IF NOT EXISTS upsert_audit ("
    " seq INTEGER PRIMARY KEY AUTOINCREMENT,"
    " id TEXT NOT NULL,"
    " operation_id TEXT NOT NULL,"
    " node_id TEXT NOT NULL,"
    " node_kind TEXT NOT NULL,"
    " operation_type TEXT NOT NULL,"
    " old_value TEXT,"
    " new_value TEXT,"
    " timestamp TEXT NOT NULL,"
    " source TEXT NOT NULL,"
    " processing_time_ms INTEGER NOT NULL);";

static constexpr const char* CREATE_POSTGRES_UPSERT_AUDIT =
    "CREATE TABLE IF NOT EXISTS upsert_audit ("
    " seq BIGSERIAL PRIMARY KEY,"
    " id TEXT NOT NULL,"
    " operation_id TEXT NOT NULL,"
    " node_id TEXT NOT NULL,"
    " node_kind TEXT NOT NULL,"
    " operation_type TEXT NOT NULL,"
    " old_value TEXT,"
    " new_value TEXT,"
    " timestamp TEXT NOT NULL,"
    " source TEXT NOT NULL,"
    " processing_time_ms BIGINT NOT NULL);";

static constexpr const char* CREATE_UPSERT_AUDIT_OPERATION_INDEX =
    "CREATE INDEX IF NOT EXISTS upsert_audit_operation_idx ON upsert_audit(operation_id);";

// nodes

static constexpr const char* SELECT_NODE =
    "SELECT id,label,properties FROM graph_nodes WHERE id=?;";

static constexpr const char* INSERT_NODE =
    "INSERT INTO graph_nodes(id,label,properties) VALUES(?,?,?);";

static constexpr const char* UPDATE_NODE =
    "UPDATE graph_nodes SET label=?,properties=? WHERE id=?;";

// edges

static constexpr const char* INSERT_EDGE_IF_ABSENT =
    "INSERT INTO graph_edges(from_id,to_id,type,kind,context,properties)"
    " VALUES(?,?,?,?,?,?)"
    " ON CONFLICT(from_id,to_id,type,kind,context) DO NOTHING;";

static constexpr const char* SELECT_EDGES_FROM =
    "SELECT from_id,to_id,type,kind,context,properties"
    " FROM graph_edges WHERE from_id=? ORDER BY rowid;";

// audit

static constexpr const char* INSERT_AUDIT =
    "INSERT INTO upsert_audit(id,operation_id,node_id,node_kind,operation_type,old_value,new_value,timestamp,source,processing_time_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_AUDITS =
    "SELECT seq,id,operation_id,node_id,node_kind,operation_type,old_value,new_value,timestamp,source,processing_time_ms"
    " FROM upsert_audit WHERE (?='' OR operation_id=?) ORDER BY seq;";

// statistics

static constexpr const char* COUNT_NODES_BY_LABEL =
    "SELECT label,COUNT(*) FROM graph_nodes GROUP BY label;";

static constexpr const char* COUNT_EDGES_BY_TYPE =
    "SELECT type,COUNT(*) FROM graph_edges GROUP BY type;";

static constexpr const char* COUNT_AUDITS =
    "SELECT COUNT(*) FROM upsert_audit;";

} // namespace codegraph::db::sql
