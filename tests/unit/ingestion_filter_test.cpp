#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ingest/ingestion_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace codegraph::ingest;
namespace db     = codegraph::db;
namespace model  = codegraph::model;
namespace upsert = codegraph::upsert;
namespace util   = codegraph::util;

std::shared_ptr<upsert::UpsertEngine> MemoryEngine() {
  return std::make_shared<upsert::UpsertEngine>(std::make_shared<db::memory::MemoryRepository>(), nullptr);
}

v1::ParsedEntity Method(const std::string& name, const std::string& visibility) {
  v1::ParsedEntity record;
  record.set_kind(v1::ENTITY_KIND_METHOD);
  record.set_name(name);
  record.set_package_name("com.example");
  record.set_declaring_class("UserService");
  record.set_file_path("src/main/java/com/example/UserService.java");
  if (!visibility.empty()) record.set_visibility(visibility);
  return record;
}

void TestPrivateDetection() {
  assert(IsPrivateRecord(Method("hash", "private")));
  assert(IsPrivateRecord(Method("hash", " PRIVATE ")));
  assert(!IsPrivateRecord(Method("find", "public")));

  auto by_modifier = Method("hash", "");
  by_modifier.add_modifiers("private");
  by_modifier.add_modifiers("static");
  assert(IsPrivateRecord(by_modifier));

  // explicit visibility wins over modifiers
  auto explicit_public = Method("hash", "public");
  explicit_public.add_modifiers("private");
  assert(!IsPrivateRecord(explicit_public));
}

void TestTestDetection() {
  auto in_test_tree = Method("setUp", "public");
  in_test_tree.set_file_path("src/test/java/com/example/UserServiceFixture.java");
  assert(IsTestRecord(in_test_tree));

  auto windows_path = Method("setUp", "public");
  windows_path.set_file_path("src\\test\\java\\Fixture.java");
  assert(IsTestRecord(windows_path));

  auto test_class = Method("find", "public");
  test_class.set_declaring_class("UserServiceTest");
  assert(IsTestRecord(test_class));

  v1::ParsedEntity cls;
  cls.set_kind(v1::ENTITY_KIND_CLASS);
  cls.set_name("OrderTest");
  assert(IsTestRecord(cls));

  auto production = Method("find", "public");
  assert(!IsTestRecord(production));

  auto lookalike = Method("find", "public");
  lookalike.set_file_path("src/main/java/com/example/testing/Helper.java");
  assert(!IsTestRecord(lookalike));
}

void TestDefaultsDropPrivateAndTests() {
  IngestionService service(MemoryEngine(), IngestionOptions{});

  assert(service.Accepts(Method("find", "public")));
  assert(!service.Accepts(Method("hash", "private")));

  auto test_method = Method("find", "public");
  test_method.set_declaring_class("UserServiceTest");
  assert(!service.Accepts(test_method));

  // scope records are never filtered
  v1::ParsedEntity package;
  package.set_kind(v1::ENTITY_KIND_PACKAGE);
  package.set_name("com.example.test");
  package.set_file_path("src/test/java/com/example/test");
  assert(service.Accepts(package));
}

void TestIncludeFlagsAndFileSize() {
  IngestionOptions options;
  options.include_private     = true;
  options.include_tests       = true;
  options.max_file_size_bytes = 1024;
  IngestionService service(MemoryEngine(), options);

  assert(service.Accepts(Method("hash", "private")));

  auto test_method = Method("find", "public");
  test_method.set_declaring_class("UserServiceTest");
  assert(service.Accepts(test_method));

  auto small = Method("find", "public");
  small.set_file_size_bytes(1024);
  assert(service.Accepts(small));

  auto large = Method("find", "public");
  large.set_file_size_bytes(1025);
  assert(!service.Accepts(large));

  // unknown size is never filtered
  auto unknown = Method("find", "public");
  assert(service.Accepts(unknown));
}

void TestOptionsFromConfig() {
  codegraph::runtime::config::RuntimeConfig config;
  config.mutable_ingestion()->set_worker_threads(3);
  config.mutable_ingestion()->set_include_tests(true);
  config.mutable_ingestion()->set_max_file_size_bytes(4096);
  config.mutable_upsert()->set_annotation_attribute_policy("last_seen");

  auto options = IngestionOptions::FromConfig(config);
  assert(options.worker_threads == 3);
  assert(!options.include_private);
  assert(options.include_tests);
  assert(options.max_file_size_bytes == 4096u);
  assert(options.attribute_policy == model::AttributePolicy::kLastSeen);

  config.mutable_upsert()->set_annotation_attribute_policy("sometimes");
  bool threw = false;
  try {
    IngestionOptions::FromConfig(config);
  } catch (const util::InvalidConfiguration&) {
    threw = true;
  }
  assert(threw);
}

void TestNullEngineRejected() {
  bool threw = false;
  try {
    IngestionService service(nullptr, IngestionOptions{});
  } catch (const util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPrivateDetection();
  TestTestDetection();
  TestDefaultsDropPrivateAndTests();
  TestIncludeFlagsAndFileSize();
  TestOptionsFromConfig();
  TestNullEngineRejected();

  std::cout << "codegraph_unit_ingestion_filter: pass\n";
  return 0;
}
