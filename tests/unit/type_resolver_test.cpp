#include "internal/resolve/type_resolver.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "internal/resolve/import_table.hpp"

namespace {

using namespace codegraph::resolve;

void TestGenericArgumentExtraction() {
  assert((ExtractGenericTypeArguments("Map<String, Object>") == std::vector<std::string>{"String", "Object"}));
  assert((ExtractGenericTypeArguments("List<? extends Number>") == std::vector<std::string>{"? extends Number"}));
  assert(ExtractGenericTypeArguments("String").empty());
  assert((ExtractGenericTypeArguments("Map<String, List<Order>>") == std::vector<std::string>{"String", "List"}));
  assert(ExtractGenericTypeArguments("List<?>").empty());

  assert((SplitTypeArguments("Map<String, List<Order>>") == std::vector<std::string>{"String", "List<Order>"}));
  assert(WildcardBound("? super Integer") == "Integer");
  assert(WildcardBound("Order") == "Order");
}

void TestTypeTextHelpers() {
  assert(ExtractSimpleTypeName("java.util.List<String>[]") == "List");
  assert(ExtractSimpleTypeName("String...") == "String");
  assert(StripTypeDecorations(" java.util.Map<K, V> ") == "java.util.Map");
  assert(ExtractPackageName("com.example.model.User") == "com.example.model");
  assert(ExtractPackageName("User").empty());
  assert(ExtractSimpleClassName("com.example.model.User") == "User");

  assert(IsPrimitiveType("int"));
  assert(IsPrimitiveType("void"));
  assert(!IsPrimitiveType("Integer"));

  assert(IsExternalClass("java.util.List"));
  assert(IsExternalClass("org.springframework.stereotype.Service"));
  assert(!IsExternalClass("com.example.User"));

  assert(BuiltinQualifiedName("String") == "java.lang.String");
  assert(BuiltinQualifiedName("Optional") == "java.util.Optional");
  assert(BuiltinQualifiedName("Widget").empty());
}

void TestImportTable() {
  auto imports = ImportTable::Parse({"java.util.List;", "com.example.model.*", "static org.junit.Assert.assertEquals", "java.util.List"});

  assert(imports.Lookup("List") == std::optional<std::string>("java.util.List"));
  assert(imports.LookupStaticMember("assertEquals") == std::optional<std::string>("org.junit.Assert"));
  assert(imports.Lookup("Assert") == std::optional<std::string>("org.junit.Assert"));
  assert((imports.WildcardPackages() == std::vector<std::string>{"com.example.model"}));
  assert((imports.ImportedTypes() == std::vector<std::string>{"java.util.List", "org.junit.Assert"}));
  assert(!imports.Empty());
}

void TestResolutionOrder() {
  std::set<std::string> known = {"com.example.service.UserRepository", "com.example.model.User", "com.example.service.List"};
  TypeResolver          resolver([&known](const std::string& fqn) { return known.contains(fqn); });

  auto imports = ImportTable::Parse({"java.util.List", "com.example.model.*", "com.example.api.Outer"});

  // import beats a same-package class of the same simple name
  auto list = resolver.Resolve("List<User>", imports, "com.example.service");
  assert(list.fully_qualified_name == "java.util.List");
  assert(list.resolution == Resolution::kImport);

  auto repo = resolver.Resolve("UserRepository", imports, "com.example.service");
  assert(repo.fully_qualified_name == "com.example.service.UserRepository");
  assert(repo.resolution == Resolution::kSamePackage);

  auto user = resolver.Resolve("User", imports, "com.example.service");
  assert(user.fully_qualified_name == "com.example.model.User");
  assert(user.resolution == Resolution::kWildcard);

  auto text = resolver.Resolve("String", imports, "com.example.service");
  assert(text.fully_qualified_name == "java.lang.String");
  assert(text.resolution == Resolution::kBuiltin);

  auto nested = resolver.Resolve("Outer.Inner", imports, "com.example.service");
  assert(nested.fully_qualified_name == "com.example.api.Outer.Inner");
  assert(nested.resolution == Resolution::kImport);

  auto qualified = resolver.Resolve("org.acme.Thing", imports, "com.example.service");
  assert(qualified.fully_qualified_name == "org.acme.Thing");
  assert(qualified.resolution == Resolution::kQualified);

  auto unknown = resolver.Resolve("Mystery", imports, "com.example.service");
  assert(unknown.fully_qualified_name == "com.example.service.Mystery");
  assert(!unknown.resolved());

  auto default_package = resolver.Resolve("Mystery", ImportTable{}, "");
  assert(default_package.fully_qualified_name == "Mystery");

  auto bounded = resolver.Resolve("? extends User", imports, "com.example.service");
  assert(bounded.fully_qualified_name == "com.example.model.User");
}

} // namespace

int main() {
  TestGenericArgumentExtraction();
  TestTypeTextHelpers();
  TestImportTable();
  TestResolutionOrder();

  std::cout << "codegraph_unit_type_resolver: pass\n";
  return 0;
}
