#include "internal/identity/node_id_validator.hpp"

#include <cassert>
#include <iostream>

#include "internal/identity/node_identifier.hpp"

namespace {

using namespace codegraph::identity;
using codegraph::model::NodeKind;

void TestStrictFormats() {
  auto class_id = GenerateClassId("com.example", "Order");
  assert(ValidateStrict(class_id, NodeKind::kClass).valid);
  assert(ValidateStrict(GenerateMethodId(class_id, "total", {"int"}), NodeKind::kMethod).valid);
  assert(ValidateStrict(GenerateMethodId(class_id, "total", {}), NodeKind::kMethod).valid);
  assert(ValidateStrict(GenerateFieldId(class_id, "lines", "List<Line>"), NodeKind::kField).valid);

  auto repo_id = GenerateRepositoryId("/src/shop", "shop");
  assert(ValidateStrict(repo_id, NodeKind::kRepository).valid);
  assert(ValidateStrict(GenerateModuleId(repo_id, "core"), NodeKind::kModule).valid);

  auto bad = ValidateStrict("method:com.example:Order:total:XYZ", NodeKind::kMethod);
  assert(!bad.valid);
  assert(!bad.message.empty());

  assert(!ValidateStrict("", NodeKind::kClass).valid);
  assert(!ValidateStrict("class:com.example:", NodeKind::kClass).valid);
}

void TestCollisionRisk() {
  assert(AnalyzeCollisionRisk("package:", NodeKind::kPackage).level == RiskLevel::kHigh);
  assert(AnalyzeCollisionRisk("package:util", NodeKind::kPackage).level == RiskLevel::kMedium);
  assert(AnalyzeCollisionRisk("package:com.example", NodeKind::kPackage).level == RiskLevel::kLow);

  assert(AnalyzeCollisionRisk("class::A", NodeKind::kClass).level == RiskLevel::kMedium);
  assert(AnalyzeCollisionRisk("class:com.example:Order", NodeKind::kClass).level == RiskLevel::kLow);

  assert(AnalyzeCollisionRisk("annotation:Custom", NodeKind::kAnnotation).level == RiskLevel::kMedium);

  auto invalid = AnalyzeCollisionRisk("not-an-id", NodeKind::kClass);
  assert(invalid.level == RiskLevel::kUnknown);
  assert(ToString(invalid.level) == "UNKNOWN");
}

} // namespace

int main() {
  TestStrictFormats();
  TestCollisionRisk();

  std::cout << "codegraph_unit_node_id_validator: pass\n";
  return 0;
}
