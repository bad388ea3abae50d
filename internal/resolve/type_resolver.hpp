#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/resolve/import_table.hpp"

namespace codegraph::resolve {

enum class Resolution {
  kImport,       // exact single-type or static import
  kSamePackage,  // a class minted in the declaring package
  kWildcard,     // a known class under a wildcard-imported package
  kBuiltin,      // java.lang / java.util defaults
  kQualified,    // already written fully qualified
  kUnresolved,   // best-effort label only
};

struct ResolvedType {
  std::string fully_qualified_name;
  std::string simple_name;
  Resolution  resolution = Resolution::kUnresolved;

  bool resolved() const {
    return resolution != Resolution::kUnresolved;
  }
};

// True when a class with this fully-qualified name is minted in the
// current ingestion.
using KnownTypeLookup = std::function<bool(const std::string& fully_qualified_name)>;

/*
  Best-guess resolution of a type reference.

  Order: import table, same-package class known to this ingestion,
  wildcard import of a known class, built-in default, then unresolved.
  An unresolved simple name is labelled in the declaring package (or
  kept as-is in the default package) so it can still be an edge target.
  Unresolved is never an error.
*/
class TypeResolver {
 public:
  explicit TypeResolver(KnownTypeLookup known = {});

  ResolvedType Resolve(std::string_view type_reference, const ImportTable& imports, std::string_view current_package) const;

 private:
  bool IsKnown(const std::string& fqn) const;

  KnownTypeLookup known_;
};

// ---------------------------------------------------------------------
// Type text helpers
// ---------------------------------------------------------------------

// "a.b.C" -> "C"
std::string ExtractSimpleClassName(std::string_view fully_qualified_name);

// "java.util.List<String>[]" -> "List"; varargs and arrays dropped.
std::string ExtractSimpleTypeName(std::string_view type_declaration);

// "java.util.List<String>[]" -> "java.util.List"
std::string StripTypeDecorations(std::string_view type_declaration);

// "a.b.C" -> "a.b"; "" when unqualified.
std::string ExtractPackageName(std::string_view fully_qualified_name);

bool IsPrimitiveType(std::string_view type_name);

// Heuristic: common JDK and framework namespaces.
bool IsExternalClass(std::string_view fully_qualified_name);

// Canonical name of a java.lang / java.util default, or "" if not built in.
std::string BuiltinQualifiedName(std::string_view simple_name);

/*
  Top-level type arguments between the outermost angle brackets, split
  nesting-aware. Nested generics surface their outer token only
  ("Map<String, List<Object>>" -> ["String", "List"]); a bounded
  wildcard is one token ("? extends Number"); bare "?" and primitive
  arguments are dropped.
*/
std::vector<std::string> ExtractGenericTypeArguments(std::string_view type_declaration);

// Same split without filtering or truncation; nested text is kept whole.
std::vector<std::string> SplitTypeArguments(std::string_view type_declaration);

// "? extends Number" -> "Number"; anything else unchanged.
std::string WildcardBound(std::string_view type_argument);

} // namespace codegraph::resolve
