#include "internal/upsert/upsert_engine.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>
#include <variant>

#include "internal/identity/node_identifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace codegraph::upsert {

namespace {

using SteadyClock = std::chrono::steady_clock;

UpsertResult& Fail(UpsertResult& result, ErrorKind kind, std::string message) {
  result.success       = false;
  result.error_kind    = kind;
  result.error_message = std::move(message);
  return result;
}

/*
  Annotation attributes accumulate across sightings: the incoming node
  is folded into what is already stored before comparing, so a use
  that omits an attribute never erases it.
*/
model::EntityNode MergeWithStored(const db::StoredNode& existing, const model::EntityNode& incoming, model::AttributePolicy policy) {
  const auto* annotation = std::get_if<model::AnnotationNode>(&incoming);
  if (!annotation || existing.kind != model::NodeKind::kAnnotation) return incoming;

  auto stored = std::get<model::AnnotationNode>(model::FromProperties(model::NodeKind::kAnnotation, existing.properties));

  model::AnnotationNode merged = *annotation;
  merged.attributes            = stored.attributes;
  model::MergeAttributes(merged.attributes, annotation->attributes, policy);

  const bool keep_stored_target = policy == model::AttributePolicy::kFirstSeen ? !stored.target_type.empty() : merged.target_type.empty();
  if (keep_stored_target) merged.target_type = stored.target_type;
  return merged;
}

std::string StringProperty(const model::PropertyMap& properties, const std::string& key) {
  auto it = properties.find(key);
  if (it == properties.end()) return {};
  if (const auto* value = std::get_if<std::string>(&it->second)) return *value;
  return {};
}

} // namespace

UpsertEngine::UpsertEngine(std::shared_ptr<db::GraphRepository> repository, std::shared_ptr<UpsertStatistics> statistics, UpsertOptions options)
    : repository_(std::move(repository)), statistics_(std::move(statistics)), options_(std::move(options)) {
  if (!repository_) {
    throw util::InvalidArgument("repository cannot be null");
  }
  if (!statistics_) {
    statistics_ = std::make_shared<UpsertStatistics>();
  }
}

std::string UpsertEngine::NextOperationId() {
  auto seq = sequence_.fetch_add(1, std::memory_order_relaxed) + 1;
  return "upsert_" + std::to_string(util::ToUnixMillis(util::Now())) + "_" + std::to_string(seq);
}

void UpsertEngine::RecordStatistics(const std::vector<UpsertResult>& results) {
  for (const auto& result : results) {
    statistics_->Record(result);
  }
}

// ------------------------------------------------------------------
// Nodes
// ------------------------------------------------------------------

std::vector<UpsertResult> UpsertEngine::UpsertBatch(const std::vector<model::EntityNode>& nodes) {
  observability::SpanScope span("codegraph.upsert_batch");
  span.SetAttribute("batch_size", static_cast<std::int64_t>(nodes.size()));

  const auto started      = SteadyClock::now();
  const auto operation_id = NextOperationId();
  span.SetAttribute("operation_id", operation_id);

  std::unique_ptr<db::Transaction> tx;
  try {
    tx = repository_->Begin();
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    throw util::PersistenceFailure("Failed to begin upsert batch " + operation_id + ": " + e.what());
  }

  auto results = UpsertBatch(*tx, nodes, operation_id);

  try {
    tx->Commit();
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    throw util::PersistenceFailure("Failed to commit upsert batch " + operation_id + ": " + e.what());
  }

  RecordStatistics(results);

  std::int64_t inserted = 0, updated = 0, skipped = 0, failed = 0;
  for (const auto& result : results) {
    if (!result.success) {
      ++failed;
    } else if (result.operation_type == OperationType::kInsert) {
      ++inserted;
    } else if (result.operation_type == OperationType::kUpdate) {
      ++updated;
    } else {
      ++skipped;
    }
  }

  CODEGRAPH_LOG_INFO("Upsert batch completed",
                     {observability::StringField("operation_id", operation_id), observability::IntField("nodes", static_cast<std::int64_t>(nodes.size())),
                      observability::IntField("inserted", inserted), observability::IntField("updated", updated),
                      observability::IntField("skipped", skipped), observability::IntField("failed", failed),
                      observability::IntField("elapsed_ms", static_cast<std::int64_t>(util::ElapsedMs(started)))});
  return results;
}

std::vector<UpsertResult> UpsertEngine::UpsertBatch(db::Transaction& tx, const std::vector<model::EntityNode>& nodes,
                                                    const std::string& operation_id) {
  std::vector<UpsertResult> results;
  results.reserve(nodes.size());

  for (const auto& node : nodes) {
    auto result = Reconcile(tx, node, operation_id);
    if (!result.success) {
      CODEGRAPH_LOG_WARN("Upsert failed",
                         {observability::StringField("operation_id", operation_id), observability::StringField("node_id", result.node_id),
                          observability::StringField("error", ToString(result.error_kind)),
                          observability::StringField("message", result.error_message)});
    }
    results.push_back(std::move(result));
  }
  return results;
}

UpsertResult UpsertEngine::UpsertNode(const model::EntityNode& node) {
  auto results = UpsertBatch(std::vector<model::EntityNode>{node});
  return std::move(results.front());
}

UpsertResult UpsertEngine::Reconcile(db::Transaction& tx, const model::EntityNode& node, const std::string& operation_id) {
  const auto started = SteadyClock::now();

  UpsertResult result;
  result.node_id        = model::IdOf(node);
  result.node_kind      = model::KindOf(node);
  result.operation_id   = operation_id;
  result.timestamp      = util::ToRfc3339(util::Now());
  result.operation_type = OperationType::kInsert;

  auto finish = [&]() -> UpsertResult& {
    result.processing_time_ms = util::ElapsedMs(started);
    return result;
  };

  if (!identity::ValidateNodeId(result.node_id, result.node_kind)) {
    Fail(result, ErrorKind::kInvalidArgument,
         "Invalid node id for " + std::string(model::ToString(result.node_kind)) + ": '" + result.node_id + "'");
    return finish();
  }

  std::optional<db::StoredNode> existing;
  try {
    existing = repository_->FindNodeById(tx, result.node_id);
  } catch (const std::exception& e) {
    throw util::PersistenceFailure("Failed to look up node " + result.node_id + ": " + e.what());
  }

  // -------------------------------------------------------------------
  // INSERT
  // -------------------------------------------------------------------
  if (!existing) {
    if (!model::AllowsInsert(options_.mode)) {
      Fail(result, ErrorKind::kNotFound, "Node not found for update_only mode: " + result.node_id);
      return finish();
    }

    db::StoredNode stored{result.node_id, result.node_kind, model::ToProperties(node)};
    stored.properties["created_at"] = result.timestamp;
    stored.properties["updated_at"] = result.timestamp;

    if (auto rc = repository_->InsertNode(tx, stored); !rc) {
      throw util::PersistenceFailure("Failed to insert node " + result.node_id + ": " + rc.message);
    }

    result.success        = true;
    result.property_count = stored.properties.size();
    finish();
    Audit(tx, result, std::nullopt, std::move(stored.properties));
    return result;
  }

  // -------------------------------------------------------------------
  // Existing node
  // -------------------------------------------------------------------
  result.operation_type = OperationType::kUpdate;

  if (existing->kind != result.node_kind) {
    auto comparison = CompareNodes(*existing, node);
    Fail(result, ErrorKind::kConflict, comparison.conflict_reason);
    return finish();
  }

  if (!model::AllowsUpdate(options_.mode)) {
    Fail(result, ErrorKind::kAlreadyExists, "Node already exists in insert_only mode: " + result.node_id);
    return finish();
  }

  auto prepared   = MergeWithStored(*existing, node, options_.attribute_policy);
  auto comparison = CompareNodes(*existing, prepared);

  if (comparison.outcome == ComparisonOutcome::kConflict) {
    Fail(result, ErrorKind::kConflict, comparison.conflict_reason);
    return finish();
  }

  if (!comparison.requires_update) {
    result.operation_type = OperationType::kSkip;
    result.success        = true;
    return finish();
  }

  db::StoredNode merged{result.node_id, result.node_kind, model::ToProperties(prepared)};
  auto           created_at     = StringProperty(existing->properties, "created_at");
  merged.properties["created_at"] = created_at.empty() ? result.timestamp : created_at;
  merged.properties["updated_at"] = result.timestamp;

  if (auto rc = repository_->UpdateNode(tx, merged); !rc) {
    throw util::PersistenceFailure("Failed to update node " + result.node_id + ": " + rc.message);
  }

  for (const auto& [key, change] : comparison.changes) {
    if (change.significant) result.changed_properties.push_back(key);
  }
  result.property_count = result.changed_properties.size();
  result.success        = true;
  finish();
  Audit(tx, result, existing->properties, std::move(merged.properties));
  return result;
}

void UpsertEngine::Audit(db::Transaction& tx, const UpsertResult& result, std::optional<model::PropertyMap> old_value,
                         std::optional<model::PropertyMap> new_value) {
  if (!options_.audit_enabled) return;

  const auto kind = std::string(model::ToString(result.node_kind));

  db::AuditRecord record;
  record.id                 = identity::GenerateAuditId(result.operation_id, kind, result.node_id);
  record.operation_id       = result.operation_id;
  record.node_id            = result.node_id;
  record.node_kind          = kind;
  record.operation_type     = std::string(ToString(result.operation_type));
  record.old_value          = std::move(old_value);
  record.new_value          = std::move(new_value);
  record.timestamp          = result.timestamp;
  record.source             = options_.source;
  record.processing_time_ms = static_cast<std::int64_t>(result.processing_time_ms);

  if (auto rc = repository_->InsertAudit(tx, record); !rc) {
    throw util::PersistenceFailure("Failed to write audit record for " + result.node_id + ": " + rc.message);
  }
}

// ------------------------------------------------------------------
// Edges
// ------------------------------------------------------------------

EdgeWriteResult UpsertEngine::UpsertEdges(const std::vector<model::RelationshipEdge>& edges) {
  observability::SpanScope span("codegraph.upsert_edges");
  span.SetAttribute("edge_count", static_cast<std::int64_t>(edges.size()));

  std::unique_ptr<db::Transaction> tx;
  try {
    tx = repository_->Begin();
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    throw util::PersistenceFailure(std::string("Failed to begin edge batch: ") + e.what());
  }

  auto written = UpsertEdges(*tx, edges);

  try {
    tx->Commit();
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    throw util::PersistenceFailure(std::string("Failed to commit edge batch: ") + e.what());
  }

  CODEGRAPH_LOG_DEBUG("Edge batch completed", {observability::IntField("created", static_cast<std::int64_t>(written.created)),
                                               observability::IntField("existing", static_cast<std::int64_t>(written.existing))});
  return written;
}

EdgeWriteResult UpsertEngine::UpsertEdges(db::Transaction& tx, const std::vector<model::RelationshipEdge>& edges) {
  EdgeWriteResult written;
  for (const auto& edge : edges) {
    bool created = false;
    if (auto rc = repository_->CreateEdgeIfAbsent(tx, edge, &created); !rc) {
      throw util::PersistenceFailure("Failed to write edge " + edge.from_id + " -[" + std::string(model::ToString(edge.type)) + "]-> " + edge.to_id +
                                     ": " + rc.message);
    }
    if (created) {
      ++written.created;
    } else {
      ++written.existing;
    }
  }
  return written;
}

} // namespace codegraph::upsert
