#include "internal/upsert/upsert_engine.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/identity/node_identifier.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace codegraph::upsert;
namespace model    = codegraph::model;
namespace db       = codegraph::db;
namespace identity = codegraph::identity;
namespace util     = codegraph::util;

struct Harness {
  std::shared_ptr<db::memory::MemoryRepository> repository;
  std::shared_ptr<UpsertStatistics>             statistics;
  std::unique_ptr<UpsertEngine>                 engine;
};

Harness MakeHarness(UpsertOptions options = {}) {
  Harness h;
  h.repository = std::make_shared<db::memory::MemoryRepository>();
  h.statistics = std::make_shared<UpsertStatistics>();
  h.engine     = std::make_unique<UpsertEngine>(h.repository, h.statistics, options);
  return h;
}

model::ClassNode OrderClass() {
  model::ClassNode node;
  node.id                   = identity::GenerateClassId("com.example", "Order");
  node.name                 = "Order";
  node.visibility           = "public";
  node.modifiers            = {"public"};
  node.file_path            = "src/main/java/com/example/Order.java";
  node.line_start           = 3;
  node.line_end             = 40;
  node.package_name         = "com.example";
  node.fully_qualified_name = "com.example.Order";
  return node;
}

model::AnnotationNode EntityAnnotation(model::StringMap attributes, std::string target_type) {
  model::AnnotationNode node;
  node.id                   = identity::GenerateAnnotationId("jakarta.persistence", "Table");
  node.name                 = "Table";
  node.fully_qualified_name = "jakarta.persistence.Table";
  node.attributes           = std::move(attributes);
  node.target_type          = std::move(target_type);
  node.is_framework         = true;
  node.framework_type       = "JPA";
  return node;
}

std::optional<db::StoredNode> Find(db::GraphRepository& repository, const std::string& id) {
  auto tx = repository.Begin();
  return repository.FindNodeById(*tx, id);
}

std::string StringOf(const db::StoredNode& node, const std::string& key) {
  return std::get<std::string>(node.properties.at(key));
}

// Fails every insert; everything else goes to an in-memory store.
class FailingInsertRepository final : public db::GraphRepository {
 public:
  std::unique_ptr<db::Transaction> Begin() override {
    return inner_.Begin();
  }
  std::optional<db::StoredNode> FindNodeById(db::Transaction& tx, const std::string& id) override {
    return inner_.FindNodeById(tx, id);
  }
  db::Result InsertNode(db::Transaction&, const db::StoredNode&) override {
    return db::Result::Err(db::ErrorCode::IOError, "disk full");
  }
  db::Result UpdateNode(db::Transaction& tx, const db::StoredNode& node) override {
    return inner_.UpdateNode(tx, node);
  }
  db::Result CreateEdgeIfAbsent(db::Transaction& tx, const model::RelationshipEdge& edge, bool* created) override {
    return inner_.CreateEdgeIfAbsent(tx, edge, created);
  }
  std::vector<model::RelationshipEdge> ListEdges(db::Transaction& tx, const std::string& from_id) override {
    return inner_.ListEdges(tx, from_id);
  }
  db::Result InsertAudit(db::Transaction& tx, db::AuditRecord& record) override {
    return inner_.InsertAudit(tx, record);
  }
  std::vector<db::AuditRecord> ListAudits(db::Transaction& tx, const std::string& operation_id) override {
    return inner_.ListAudits(tx, operation_id);
  }
  db::GraphStatistics GetStatistics(db::Transaction& tx) override {
    return inner_.GetStatistics(tx);
  }

 private:
  db::memory::MemoryRepository inner_;
};

void TestInsertSkipUpdate() {
  auto h = MakeHarness();

  auto inserted = h.engine->UpsertNode(OrderClass());
  assert(inserted.success);
  assert(inserted.operation_type == OperationType::kInsert);
  assert(inserted.error_kind == ErrorKind::kNone);
  assert(inserted.operation_id.rfind("upsert_", 0) == 0);

  auto stored = Find(*h.repository, inserted.node_id);
  assert(stored.has_value());
  assert(stored->kind == model::NodeKind::kClass);
  assert(stored->properties.count("created_at") == 1);
  assert(inserted.property_count == stored->properties.size());
  const auto created_at = StringOf(*stored, "created_at");

  auto skipped = h.engine->UpsertNode(OrderClass());
  assert(skipped.success);
  assert(skipped.operation_type == OperationType::kSkip);
  assert(skipped.changed_properties.empty());
  assert(skipped.operation_id != inserted.operation_id);

  auto changed     = OrderClass();
  changed.line_end = 42;
  auto updated     = h.engine->UpsertNode(changed);
  assert(updated.success);
  assert(updated.operation_type == OperationType::kUpdate);
  assert(updated.changed_properties == std::vector<std::string>{"line_end"});
  assert(updated.property_count == 1);

  auto after = Find(*h.repository, updated.node_id);
  assert(std::get<std::int64_t>(after->properties.at("line_end")) == 42);
  assert(StringOf(*after, "created_at") == created_at);
}

void TestInsertOnlyRejectsExisting() {
  UpsertOptions options;
  options.mode = model::UpsertMode::kInsertOnly;
  auto h       = MakeHarness(options);

  assert(h.engine->UpsertNode(OrderClass()).success);

  auto again = h.engine->UpsertNode(OrderClass());
  assert(!again.success);
  assert(again.error_kind == ErrorKind::kAlreadyExists);
  assert(again.operation_type == OperationType::kUpdate);
  assert(again.error_message == "Node already exists in insert_only mode: " + again.node_id);
}

void TestUpdateOnlyRejectsMissing() {
  UpsertOptions options;
  options.mode = model::UpsertMode::kUpdateOnly;
  auto h       = MakeHarness(options);

  auto result = h.engine->UpsertNode(OrderClass());
  assert(!result.success);
  assert(result.error_kind == ErrorKind::kNotFound);
  assert(result.operation_type == OperationType::kInsert);
  assert(result.error_message == "Node not found for update_only mode: " + result.node_id);
  assert(!Find(*h.repository, result.node_id).has_value());
}

void TestKindConflict() {
  auto h = MakeHarness();

  model::MethodNode method;
  method.id          = identity::GenerateMethodId(identity::GenerateClassId("com.example", "Order"), "total", {});
  method.name        = "total";
  method.return_type = "long";

  // same id already stored under another kind
  {
    auto tx = h.repository->Begin();
    assert(h.repository->InsertNode(*tx, db::StoredNode{method.id, model::NodeKind::kClass, {{"name", std::string("total")}}}));
    tx->Commit();
  }

  auto result = h.engine->UpsertNode(method);
  assert(!result.success);
  assert(result.error_kind == ErrorKind::kConflict);
  assert(result.error_message.find("Node kind mismatch") != std::string::npos);
  assert(Find(*h.repository, method.id)->kind == model::NodeKind::kClass);
}

void TestInvalidIdDoesNotStopBatch() {
  auto h = MakeHarness();

  auto bad = OrderClass();
  bad.id   = "method:not-a-class";

  auto results = h.engine->UpsertBatch({bad, OrderClass()});
  assert(results.size() == 2);
  assert(!results[0].success);
  assert(results[0].error_kind == ErrorKind::kInvalidArgument);
  assert(results[1].success);
  assert(results[1].operation_type == OperationType::kInsert);
  assert(results[0].operation_id == results[1].operation_id);

  auto counters = h.statistics->Snapshot();
  assert(counters.insert_count == 1);
  assert(counters.error_count == 1);
  assert(counters.total_operations == 2);
}

void TestAuditTrail() {
  UpsertOptions options;
  options.audit_enabled = true;
  options.source        = "unit-test";
  auto h                = MakeHarness(options);

  auto inserted = h.engine->UpsertNode(OrderClass());
  auto skipped  = h.engine->UpsertNode(OrderClass());

  auto changed       = OrderClass();
  changed.superclass = "com.example.BaseEntity";
  auto updated       = h.engine->UpsertNode(changed);
  assert(updated.operation_type == OperationType::kUpdate);

  auto tx = h.repository->Begin();

  auto insert_audits = h.repository->ListAudits(*tx, inserted.operation_id);
  assert(insert_audits.size() == 1);
  assert(insert_audits[0].operation_type == "INSERT");
  assert(insert_audits[0].node_kind == "Class");
  assert(insert_audits[0].source == "unit-test");
  assert(!insert_audits[0].old_value.has_value());
  assert(insert_audits[0].new_value.has_value());
  assert(insert_audits[0].id == identity::GenerateAuditId(inserted.operation_id, "Class", inserted.node_id));

  assert(h.repository->ListAudits(*tx, skipped.operation_id).empty());

  auto update_audits = h.repository->ListAudits(*tx, updated.operation_id);
  assert(update_audits.size() == 1);
  assert(update_audits[0].operation_type == "UPDATE");
  assert(update_audits[0].old_value->count("superclass") == 0);
  assert(std::get<std::string>(update_audits[0].new_value->at("superclass")) == "com.example.BaseEntity");

  assert(h.repository->ListAudits(*tx, "").size() == 2);
}

void TestAuditDisabledWritesNothing() {
  auto h = MakeHarness();
  h.engine->UpsertNode(OrderClass());

  auto tx = h.repository->Begin();
  assert(h.repository->ListAudits(*tx, "").empty());
  assert(h.repository->GetStatistics(*tx).audit_records == 0);
}

void TestStatisticsAccumulateAndReset() {
  auto h = MakeHarness();

  h.engine->UpsertNode(OrderClass());
  h.engine->UpsertNode(OrderClass());
  auto changed       = OrderClass();
  changed.line_start = 4;
  h.engine->UpsertNode(changed);

  auto counters = h.statistics->Snapshot();
  assert(counters.insert_count == 1);
  assert(counters.skip_count == 1);
  assert(counters.update_count == 1);
  assert(counters.error_count == 0);
  assert(counters.total_operations == 3);
  assert(counters.total_processing_time_ms >= 0.0);

  h.statistics->Reset();
  assert(h.statistics->Snapshot().total_operations == 0);
  assert(h.engine->Statistics() == h.statistics);
}

void TestAnnotationFirstSeenKeepsStoredAttributes() {
  auto h = MakeHarness();

  assert(h.engine->UpsertNode(EntityAnnotation({{"name", "orders"}}, "class")).success);

  // a later use without attributes leaves the node untouched
  auto bare = h.engine->UpsertNode(EntityAnnotation({}, ""));
  assert(bare.operation_type == OperationType::kSkip);

  // a conflicting value loses, a new key is added
  auto more = h.engine->UpsertNode(EntityAnnotation({{"name", "ignored"}, {"schema", "sales"}}, "field"));
  assert(more.operation_type == OperationType::kUpdate);
  assert(more.changed_properties == std::vector<std::string>{"attributes"});

  auto stored     = Find(*h.repository, more.node_id);
  auto annotation = std::get<model::AnnotationNode>(model::FromProperties(model::NodeKind::kAnnotation, stored->properties));
  assert(annotation.attributes.at("name") == "orders");
  assert(annotation.attributes.at("schema") == "sales");
  assert(annotation.target_type == "class");
}

void TestAnnotationLastSeenOverwrites() {
  UpsertOptions options;
  options.attribute_policy = model::AttributePolicy::kLastSeen;
  auto h                   = MakeHarness(options);

  h.engine->UpsertNode(EntityAnnotation({{"name", "orders"}, {"schema", "sales"}}, "class"));
  auto result = h.engine->UpsertNode(EntityAnnotation({{"name", "purchase_orders"}}, ""));
  assert(result.operation_type == OperationType::kUpdate);

  auto stored     = Find(*h.repository, result.node_id);
  auto annotation = std::get<model::AnnotationNode>(model::FromProperties(model::NodeKind::kAnnotation, stored->properties));
  assert(annotation.attributes.at("name") == "purchase_orders");
  assert(annotation.attributes.at("schema") == "sales");
  assert(annotation.target_type == "class");
}

// Two sources that disagree on a value, replayed in the same order on
// every ingestion.
void TestConflictingAttributeSourcesPerPolicy() {
  auto replay = [](Harness& h) {
    std::vector<OperationType> ops;
    for (int round = 0; round < 2; ++round) {
      ops.push_back(h.engine->UpsertNode(EntityAnnotation({{"name", "orders"}}, "class")).operation_type);
      ops.push_back(h.engine->UpsertNode(EntityAnnotation({{"name", "invoices"}}, "class")).operation_type);
    }
    return ops;
  };

  auto first_seen = MakeHarness();
  assert((replay(first_seen) ==
          std::vector<OperationType>{OperationType::kInsert, OperationType::kSkip, OperationType::kSkip, OperationType::kSkip}));

  // last_seen is not idempotent here: the sources trade updates forever
  UpsertOptions options;
  options.attribute_policy = model::AttributePolicy::kLastSeen;
  auto last_seen           = MakeHarness(options);
  assert((replay(last_seen) ==
          std::vector<OperationType>{OperationType::kInsert, OperationType::kUpdate, OperationType::kUpdate, OperationType::kUpdate}));
}

void TestEdgesCreatedOnce() {
  auto h = MakeHarness();

  model::ClassNode customer     = OrderClass();
  customer.id                   = identity::GenerateClassId("com.example", "Customer");
  customer.name                 = "Customer";
  customer.fully_qualified_name = "com.example.Customer";
  h.engine->UpsertBatch({OrderClass(), customer});

  model::RelationshipEdge uses;
  uses.from_id = OrderClass().id;
  uses.to_id   = customer.id;
  uses.type    = model::EdgeType::kUses;
  uses.kind    = "field_type";
  uses.context = "customer";

  auto other    = uses;
  other.kind    = "method_param";
  other.context = "assign";

  auto first = h.engine->UpsertEdges({uses, other});
  assert(first.created == 2);
  assert(first.existing == 0);

  auto second = h.engine->UpsertEdges({uses, other});
  assert(second.created == 0);
  assert(second.existing == 2);

  auto tx = h.repository->Begin();
  assert(h.repository->ListEdges(*tx, uses.from_id).size() == 2);
}

void TestPersistenceFailureRollsBackBatch() {
  auto repository = std::make_shared<FailingInsertRepository>();
  auto statistics = std::make_shared<UpsertStatistics>();
  UpsertEngine engine(repository, statistics);

  bool threw = false;
  try {
    engine.UpsertNode(OrderClass());
  } catch (const util::PersistenceFailure& e) {
    threw = true;
    assert(std::string(e.what()).find("disk full") != std::string::npos);
  }
  assert(threw);
  assert(statistics->Snapshot().total_operations == 0);
  assert(!Find(*repository, OrderClass().id).has_value());
}

void TestNullRepositoryRejected() {
  bool threw = false;
  try {
    UpsertEngine engine(nullptr, nullptr);
  } catch (const util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  UpsertEngine engine(std::make_shared<db::memory::MemoryRepository>(), nullptr);
  assert(engine.Statistics() != nullptr);
}

} // namespace

int main() {
  TestInsertSkipUpdate();
  TestInsertOnlyRejectsExisting();
  TestUpdateOnlyRejectsMissing();
  TestKindConflict();
  TestInvalidIdDoesNotStopBatch();
  TestAuditTrail();
  TestAuditDisabledWritesNothing();
  TestStatisticsAccumulateAndReset();
  TestAnnotationFirstSeenKeepsStoredAttributes();
  TestAnnotationLastSeenOverwrites();
  TestConflictingAttributeSourcesPerPolicy();
  TestEdgesCreatedOnce();
  TestPersistenceFailureRollsBackBatch();
  TestNullRepositoryRejected();

  std::cout << "codegraph_unit_upsert_engine: pass\n";
  return 0;
}
