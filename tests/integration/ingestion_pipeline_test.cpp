#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/graph_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/identity/node_identifier.hpp"
#include "internal/ingest/ingestion_service.hpp"
#include "internal/upsert/upsert_engine.hpp"

#if CODEGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using codegraph::db::GraphRepository;
using codegraph::ingest::IngestionOptions;
using codegraph::ingest::IngestionReport;
using codegraph::ingest::IngestionService;
using codegraph::ingest::v1::ParsedEntity;
namespace identity = codegraph::identity;
namespace model    = codegraph::model;
namespace upsert   = codegraph::upsert;
namespace v1       = codegraph::ingest::v1;

const std::string kPackage = "com.example.service";
const std::string kFile    = "src/main/java/com/example/service/UserService.java";

ParsedEntity Record(v1::EntityKind kind, const std::string& name, const std::string& owner, const std::string& file) {
  ParsedEntity record;
  record.set_kind(kind);
  record.set_name(name);
  record.set_package_name(kPackage);
  record.set_declaring_class(owner);
  record.set_file_path(file);
  return record;
}

/*
  UserService with one field and one method, the two classes it
  refers to, plus records that must not reach the store.
*/
std::vector<ParsedEntity> SampleRecords() {
  std::vector<ParsedEntity> records;

  records.push_back(Record(v1::ENTITY_KIND_PACKAGE, kPackage, "", ""));

  auto service = Record(v1::ENTITY_KIND_CLASS, "UserService", "", kFile);
  service.set_visibility("public");
  service.add_imports("java.util.List");
  service.set_line_start(5);
  service.set_line_end(40);
  records.push_back(service);

  auto field = Record(v1::ENTITY_KIND_FIELD, "repository", "UserService", kFile);
  field.set_field_type("UserRepository");
  field.set_line_start(7);
  records.push_back(field);

  auto method = Record(v1::ENTITY_KIND_METHOD, "findAll", "UserService", kFile);
  method.set_visibility("public");
  method.set_return_type("List<User>");
  method.set_line_start(10);
  method.set_line_end(14);
  records.push_back(method);

  auto user = Record(v1::ENTITY_KIND_CLASS, "User", "", "src/main/java/com/example/service/User.java");
  user.set_visibility("public");
  records.push_back(user);

  auto repository = Record(v1::ENTITY_KIND_CLASS, "UserRepository", "", "src/main/java/com/example/service/UserRepository.java");
  repository.set_visibility("public");
  repository.set_is_interface(true);
  records.push_back(repository);

  // filtered: private member, test source
  auto helper = Record(v1::ENTITY_KIND_METHOD, "normalize", "UserService", kFile);
  helper.set_visibility("private");
  records.push_back(helper);

  auto test = Record(v1::ENTITY_KIND_CLASS, "UserServiceTest", "", "src/test/java/com/example/service/UserServiceTest.java");
  records.push_back(test);

  // same id as an earlier record
  records.push_back(user);

  // cannot be minted: no declaring class
  records.push_back(Record(v1::ENTITY_KIND_METHOD, "orphan", "", kFile));

  return records;
}

constexpr std::size_t kStoredNodes = 6;

IngestionService MakeService(const std::shared_ptr<GraphRepository>& repository, std::uint32_t threads) {
  upsert::UpsertOptions upsert_options;
  upsert_options.audit_enabled = true;
  auto engine                  = std::make_shared<upsert::UpsertEngine>(repository, nullptr, upsert_options);

  IngestionOptions options;
  options.worker_threads = threads;
  return IngestionService(engine, options);
}

bool HasEdge(GraphRepository& repo, const std::string& from, const std::string& to, model::EdgeType type, const std::string& kind) {
  auto tx    = repo.Begin();
  auto edges = repo.ListEdges(*tx, from);
  return std::any_of(edges.begin(), edges.end(),
                     [&](const model::RelationshipEdge& e) { return e.to_id == to && e.type == type && e.kind == kind; });
}

void VerifyFirstIngestion(GraphRepository& repo, const IngestionReport& report) {
  assert(report.records_read == 10);
  assert(report.records_filtered == 2);
  assert(report.duplicate_ids == 1);
  assert(report.nodes_inserted == kStoredNodes);
  assert(report.nodes_updated == 0);
  assert(report.nodes_skipped == 0);
  assert(report.nodes_failed == 1);
  assert(report.failures.size() == 1);
  assert(report.failures[0].node_id == "orphan");
  assert(report.edges_created > 0);
  assert(report.edges_existing == 0);
  assert(report.edges_dropped == 0);
  // scope unit plus three files
  assert(report.units == 4);
  assert(report.operation_ids.size() == 4);
  assert(report.NodesWritten() == kStoredNodes);

  const auto service = identity::GenerateClassId(kPackage, "UserService");
  const auto field   = identity::GenerateFieldId(service, "repository", "UserRepository");
  const auto method  = identity::GenerateMethodId(service, "findAll", {});

  auto tx = repo.Begin();
  assert(repo.FindNodeById(*tx, service).has_value());
  assert(repo.FindNodeById(*tx, field)->kind == model::NodeKind::kField);
  assert(repo.FindNodeById(*tx, method)->kind == model::NodeKind::kMethod);
  assert(repo.FindNodeById(*tx, identity::GeneratePackageId(kPackage))->kind == model::NodeKind::kPackage);
  assert(!repo.FindNodeById(*tx, identity::GenerateClassId(kPackage, "UserServiceTest")).has_value());

  auto stats = repo.GetStatistics(*tx);
  assert(stats.nodes_by_label["Class"] == 3);
  assert(stats.TotalNodes() == static_cast<std::int64_t>(kStoredNodes));
  assert(stats.TotalEdges() == static_cast<std::int64_t>(report.edges_created));
  assert(stats.audit_records == static_cast<std::int64_t>(kStoredNodes));
  tx.reset();

  assert(HasEdge(repo, service, field, model::EdgeType::kContains, ""));
  assert(HasEdge(repo, service, method, model::EdgeType::kContains, ""));
  assert(HasEdge(repo, service, identity::GenerateClassId(kPackage, "UserRepository"), model::EdgeType::kUses, "field_type"));
  assert(HasEdge(repo, service, identity::GenerateClassId(kPackage, "User"), model::EdgeType::kUses, "generic_param"));
}

void VerifyReingestionIsIdempotent(IngestionService& service, const IngestionReport& first) {
  auto again = service.Ingest(SampleRecords());
  assert(again.nodes_inserted == 0);
  assert(again.nodes_updated == 0);
  assert(again.nodes_skipped == kStoredNodes);
  assert(again.edges_created == 0);
  assert(again.edges_existing == first.edges_created);
  assert(again.operation_ids != first.operation_ids);
}

void VerifyChangedRecordUpdates(GraphRepository& repo, IngestionService& service) {
  auto records = SampleRecords();
  for (auto& record : records) {
    if (record.name() == "findAll") record.set_line_end(18);
  }

  auto report = service.Ingest(records);
  assert(report.nodes_updated == 1);
  assert(report.nodes_skipped == kStoredNodes - 1);
  assert(report.edges_created == 0);

  const auto method = identity::GenerateMethodId(identity::GenerateClassId(kPackage, "UserService"), "findAll", {});

  auto tx     = repo.Begin();
  auto stored = repo.FindNodeById(*tx, method);
  assert(std::get<std::int64_t>(stored->properties.at("line_end")) == 18);

  auto updates = 0;
  for (const auto& audit : repo.ListAudits(*tx, "")) {
    if (audit.operation_type == "UPDATE") {
      ++updates;
      assert(audit.node_id == method);
      assert(std::get<std::int64_t>(audit.old_value->at("line_end")) == 14);
    }
  }
  assert(updates == 1);
}

void RunScenario(const std::string& name, const std::shared_ptr<GraphRepository>& repository) {
  std::cout << "running ingestion scenario: " << name << "\n";

  auto service = MakeService(repository, 2);
  auto first   = service.Ingest(SampleRecords());
  VerifyFirstIngestion(*repository, first);
  VerifyReingestionIsIdempotent(service, first);
  VerifyChangedRecordUpdates(*repository, service);
}

void TestSingleWorkerMatchesParallel() {
  auto parallel   = std::make_shared<codegraph::db::memory::MemoryRepository>();
  auto sequential = std::make_shared<codegraph::db::memory::MemoryRepository>();

  auto a = MakeService(parallel, 4).Ingest(SampleRecords());
  auto b = MakeService(sequential, 1).Ingest(SampleRecords());
  assert(a.nodes_inserted == b.nodes_inserted);
  assert(a.edges_created == b.edges_created);
}

void TestEmptyInput() {
  auto repository = std::make_shared<codegraph::db::memory::MemoryRepository>();
  auto report     = MakeService(repository, 0).Ingest({});
  assert(report.records_read == 0);
  assert(report.units == 0);
  assert(report.NodesWritten() == 0);
  assert(report.operation_ids.empty());
}

void TestMalformedAnnotationDoesNotAbortIngestion() {
  auto good = Record(v1::ENTITY_KIND_CLASS, "Good", "", "src/main/java/com/example/service/Good.java");
  auto bad  = Record(v1::ENTITY_KIND_CLASS, "Bad", "", "src/main/java/com/example/service/Bad.java");
  bad.set_visibility("public");
  bad.add_annotations()->set_name("Entity.");

  auto repository = std::make_shared<codegraph::db::memory::MemoryRepository>();
  auto report     = MakeService(repository, 2).Ingest({good, bad});
  assert(report.nodes_inserted == 2);
  assert(report.nodes_failed == 0);

  auto tx = repository->Begin();
  assert(repository->FindNodeById(*tx, identity::GenerateClassId(kPackage, "Good")).has_value());
  assert(repository->FindNodeById(*tx, identity::GenerateClassId(kPackage, "Bad")).has_value());
  assert(repository->GetStatistics(*tx).nodes_by_label["Annotation"] == 0);
}

} // namespace

int main() {
  RunScenario("memory", std::make_shared<codegraph::db::memory::MemoryRepository>());

#if CODEGRAPH_DB_SQLITE
  const auto db_path =
      (std::filesystem::temp_directory_path() /
       ("codegraph_integration_ingest_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) + ".db"))
          .string();
  {
    auto db = std::make_shared<codegraph::db::sqlite::SqliteDB>(db_path);
    codegraph::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    RunScenario("sqlite", std::make_shared<codegraph::db::sqlite::SqliteRepository>(std::move(db)));
  }
  std::filesystem::remove(db_path);
  std::filesystem::remove(db_path + "-wal");
  std::filesystem::remove(db_path + "-shm");
#endif

  TestSingleWorkerMatchesParallel();
  TestEmptyInput();
  TestMalformedAnnotationDoesNotAbortIngestion();

  std::cout << "codegraph_integration_ingestion_pipeline: pass\n";
  return 0;
}
