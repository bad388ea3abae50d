#include "internal/identity/node_identifier.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using namespace codegraph::identity;
using codegraph::model::NodeKind;

bool IsLowerHex(const std::string& s) {
  for (char c : s) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

void TestClassIdIsDeterministic() {
  auto first  = GenerateClassId("com.example.service", "UserService");
  auto second = GenerateClassId("com.example.service", "UserService");
  assert(first == second);
  assert(first == "class:com.example.service:UserService");

  // package is normalized, class name keeps its case
  assert(GenerateClassId(" Com.Example ", "User Service") == "class:com.example:User_Service");
  assert(GenerateClassId("", "Main") == "class::Main");
}

void TestMethodIdDependsOnTypesNotNames() {
  auto class_id = GenerateClassId("com.example", "Calc");

  auto no_args = GenerateMethodId(class_id, "reset", {});
  assert(no_args == "method:com.example:Calc:reset:void");

  auto add_int     = GenerateMethodId(class_id, "add", {"int", "int"});
  auto add_int_2   = GenerateMethodId(class_id, "add", {" int ", "int"});
  auto add_integer = GenerateMethodId(class_id, "add", {"Integer", "Integer"});
  auto add_long    = GenerateMethodId(class_id, "add", {"long", "long"});

  assert(add_int == add_int_2);
  assert(add_int != add_integer);
  assert(add_int != add_long);

  auto hash = add_int.substr(add_int.rfind(':') + 1);
  assert(hash.size() == 8);
  assert(IsLowerHex(hash));
  assert(add_int.starts_with("method:com.example:Calc:add:"));

  // generic arguments collapse, so erasure-equal signatures collide
  assert(GenerateMethodId(class_id, "put", {"List<String>"}) == GenerateMethodId(class_id, "put", {"List<Integer>"}));
  // varargs and arrays share a spelling
  assert(GenerateMethodId(class_id, "all", {"String..."}) == GenerateMethodId(class_id, "all", {"String[]"}));
}

void TestFieldAndScopeIds() {
  auto class_id = GenerateClassId("com.example.service", "UserService");
  assert(GenerateFieldId(class_id, "repo", "UserRepository") == "field:com.example.service:UserService:repo:UserRepository");
  assert(GenerateFieldId(class_id, "items", "List<Item>") == "field:com.example.service:UserService:items:List<T>");
  assert(GenerateFieldId(class_id, "raw", "") == "field:com.example.service:UserService:raw:Object");

  assert(GeneratePackageId("com.example") == "package:com.example");
  assert(GeneratePackageId("") == "package:");

  assert(GenerateAnnotationId("org.springframework.stereotype", "Service") == "annotation:org.springframework.stereotype.Service");
  assert(GenerateAnnotationId("", "Custom") == "annotation:Custom");

  auto repo_id = GenerateRepositoryId("/work/shop", "shop");
  assert(repo_id.starts_with("repo:shop:"));
  assert(repo_id.size() == std::string("repo:shop:").size() + 8);
  assert(GenerateRepositoryId("work\\shop", "shop") == repo_id);

  assert(GenerateModuleId(repo_id, "services/api/") == "module:" + repo_id + ":services/api");

  assert(GenerateAuditId("upsert_1_1", "Class", "class:a:B") == "upsert_audit:upsert_1_1:Class:class:a:B");
}

void TestRequiredPartsThrow() {
  bool threw = false;
  try {
    GenerateClassId("com.example", "   ");
  } catch (const codegraph::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    GenerateMethodId("", "run", {});
  } catch (const codegraph::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    GenerateMethodId("package:com.example", "run", {});
  } catch (const codegraph::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestNormalization() {
  assert(NormalizePackageName("Com.Example Service") == "com.example.service");
  assert(NormalizeFilePath("C:\\path\\to\\file.java") == "C:/path/to/file.java");
  assert(NormalizeFilePath("/a//b///c.txt") == "a/b/c.txt");
  assert(NormalizeTypeName("Map<String, List<Integer>>") == "Map<T>");
  assert(NormalizeTypeName("  ") == "Object");
  assert(NormalizeMethodSignature("find", {"String", "int..."}) == "find(String,int[])");
  assert(ParameterHash({}) == "void");
}

void TestKindChecks() {
  assert(ValidateNodeId("class:com.example:User", NodeKind::kClass));
  assert(!ValidateNodeId("class:", NodeKind::kClass));
  assert(!ValidateNodeId("method:a:B:c:void", NodeKind::kClass));
  assert(ValidateNodeId("package:", NodeKind::kPackage));

  assert(ExtractNodeKind("field:a:B:c:int") == NodeKind::kField);
  assert(ExtractNodeKind("repo:x:0011aabb") == NodeKind::kRepository);
  assert(!ExtractNodeKind("unknown:x").has_value());

  assert(PrefixFor(NodeKind::kPackage) == kPackagePrefix);
  assert(PrefixFor(NodeKind::kClass) == kClassPrefix);
  assert(PrefixFor(NodeKind::kMethod) == kMethodPrefix);
  assert(PrefixFor(NodeKind::kField) == kFieldPrefix);
  assert(PrefixFor(NodeKind::kAnnotation) == kAnnotationPrefix);
  assert(PrefixFor(NodeKind::kModule) == kModulePrefix);
  assert(PrefixFor(NodeKind::kRepository) == kRepositoryPrefix);
}

void TestIsConsistentId() {
  codegraph::model::ClassNode order;
  order.id = GenerateClassId("com.example", "Order");
  codegraph::model::EntityNode existing{order};

  codegraph::model::ClassNode same = order;
  same.line_end                    = 99;
  codegraph::model::EntityNode incoming{same};

  codegraph::model::ClassNode other;
  other.id = GenerateClassId("com.example", "Invoice");
  codegraph::model::EntityNode different{other};

  assert(!IsConsistentId(nullptr, &incoming));
  assert(!IsConsistentId(&existing, nullptr));
  assert(!IsConsistentId(nullptr, nullptr));
  assert(IsConsistentId(&existing, &incoming));
  assert(!IsConsistentId(&existing, &different));
}

} // namespace

int main() {
  TestClassIdIsDeterministic();
  TestMethodIdDependsOnTypesNotNames();
  TestFieldAndScopeIds();
  TestRequiredPartsThrow();
  TestNormalization();
  TestKindChecks();
  TestIsConsistentId();

  std::cout << "codegraph_unit_node_identifier: pass\n";
  return 0;
}
