#include "internal/db/memory/memory_repository.hpp"

#include "internal/db/memory/memory_tx.hpp"

namespace codegraph::db::memory {

namespace {

std::string EdgeKey(const model::RelationshipEdge& edge) {
  std::string key;
  key.reserve(edge.from_id.size() + edge.to_id.size() + edge.kind.size() + edge.context.size() + 16);
  key.append(edge.from_id).push_back('\x1f');
  key.append(edge.to_id).push_back('\x1f');
  key.append(model::ToString(edge.type)).push_back('\x1f');
  key.append(edge.kind).push_back('\x1f');
  key.append(edge.context);
  return key;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

MemoryTransaction& MemoryRepository::TX(Transaction& t) {
  return static_cast<MemoryTransaction&>(t);
}

// ------------------------------------------------------------------
// Nodes
// ------------------------------------------------------------------

std::optional<StoredNode> MemoryRepository::FindNodeById(Transaction& t, const std::string& id) {
  const auto& nodes = TX(t).View().nodes;
  auto        it    = nodes.find(id);
  if (it == nodes.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::InsertNode(Transaction& t, const StoredNode& node) {
  auto& nodes = TX(t).Mutable().nodes;
  if (nodes.contains(node.id)) {
    return Result::Err(ErrorCode::AlreadyExists, "node already exists: " + node.id);
  }
  nodes.emplace(node.id, node);
  return Result::Ok();
}

Result MemoryRepository::UpdateNode(Transaction& t, const StoredNode& node) {
  auto& nodes = TX(t).Mutable().nodes;
  auto  it    = nodes.find(node.id);
  if (it == nodes.end()) {
    return Result::Err(ErrorCode::NotFound, "node not found: " + node.id);
  }
  it->second = node;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Edges
// ------------------------------------------------------------------

Result MemoryRepository::CreateEdgeIfAbsent(Transaction& t, const model::RelationshipEdge& edge, bool* created) {
  auto& state    = TX(t).Mutable();
  bool  inserted = state.edge_keys.insert(EdgeKey(edge)).second;
  if (inserted) state.edges.push_back(edge);
  if (created) *created = inserted;
  return Result::Ok();
}

std::vector<model::RelationshipEdge> MemoryRepository::ListEdges(Transaction& t, const std::string& from_id) {
  std::vector<model::RelationshipEdge> out;
  for (const auto& edge : TX(t).View().edges) {
    if (edge.from_id == from_id) out.push_back(edge);
  }
  return out;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result MemoryRepository::InsertAudit(Transaction& t, AuditRecord& record) {
  auto& state = TX(t).Mutable();
  record.seq  = state.next_audit_seq++;
  state.audits.push_back(record);
  return Result::Ok();
}

std::vector<AuditRecord> MemoryRepository::ListAudits(Transaction& t, const std::string& operation_id) {
  std::vector<AuditRecord> out;
  for (const auto& record : TX(t).View().audits) {
    if (operation_id.empty() || record.operation_id == operation_id) out.push_back(record);
  }
  return out;
}

GraphStatistics MemoryRepository::GetStatistics(Transaction& t) {
  const auto& state = TX(t).View();

  GraphStatistics stats;
  for (const auto& [id, node] : state.nodes) {
    stats.nodes_by_label[std::string(model::ToString(node.kind))]++;
  }
  for (const auto& edge : state.edges) {
    stats.edges_by_type[std::string(model::ToString(edge.type))]++;
  }
  stats.audit_records = static_cast<std::int64_t>(state.audits.size());
  return stats;
}

} // namespace codegraph::db::memory
