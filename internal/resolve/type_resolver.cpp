#include "internal/resolve/type_resolver.hpp"

#include <array>
#include <map>
#include <utility>

#include "internal/util/strings.hpp"

namespace codegraph::resolve {

namespace {

const std::map<std::string, std::string, std::less<>>& BuiltinTypes() {
  static const std::map<std::string, std::string, std::less<>> kBuiltins = [] {
    std::map<std::string, std::string, std::less<>> table;
    for (const char* name : {"String", "Object", "Integer", "Long", "Double", "Float", "Boolean", "Character", "Byte", "Short", "Number",
                             "Void", "Class", "Exception", "RuntimeException", "Throwable", "Iterable", "Runnable", "Thread", "StringBuilder",
                             "Enum", "Record", "Math", "System", "Comparable", "CharSequence", "Override", "Deprecated",
                             "SuppressWarnings", "FunctionalInterface", "SafeVarargs"}) {
      table.emplace(name, std::string("java.lang.") + name);
    }
    for (const char* name : {"List", "Map", "Set", "Collection", "Optional", "ArrayList", "HashMap", "HashSet", "LinkedList", "Iterator", "UUID"}) {
      table.emplace(name, std::string("java.util.") + name);
    }
    return table;
  }();
  return kBuiltins;
}

} // namespace

TypeResolver::TypeResolver(KnownTypeLookup known) : known_(std::move(known)) {
}

bool TypeResolver::IsKnown(const std::string& fqn) const {
  return known_ && known_(fqn);
}

ResolvedType TypeResolver::Resolve(std::string_view type_reference, const ImportTable& imports, std::string_view current_package) const {
  const auto base = StripTypeDecorations(WildcardBound(util::Trim(type_reference)));

  ResolvedType out;
  out.simple_name = ExtractSimpleClassName(base);
  if (base.empty() || base == "?") {
    return out;
  }

  if (auto dot = base.find('.'); dot != std::string::npos) {
    // Outer.Inner where Outer is imported
    if (auto outer = imports.Lookup(std::string_view(base).substr(0, dot))) {
      out.fully_qualified_name = *outer + base.substr(dot);
      out.resolution           = Resolution::kImport;
      return out;
    }
    out.fully_qualified_name = base;
    out.resolution           = Resolution::kQualified;
    return out;
  }

  if (auto imported = imports.Lookup(base)) {
    out.fully_qualified_name = *imported;
    out.resolution           = Resolution::kImport;
    return out;
  }

  const auto same_package = current_package.empty() ? base : std::string(current_package) + "." + base;
  if (IsKnown(same_package)) {
    out.fully_qualified_name = same_package;
    out.resolution           = Resolution::kSamePackage;
    return out;
  }

  for (const auto& package : imports.WildcardPackages()) {
    auto candidate = package + "." + base;
    if (IsKnown(candidate)) {
      out.fully_qualified_name = std::move(candidate);
      out.resolution           = Resolution::kWildcard;
      return out;
    }
  }

  if (auto builtin = BuiltinQualifiedName(base); !builtin.empty()) {
    out.fully_qualified_name = std::move(builtin);
    out.resolution           = Resolution::kBuiltin;
    return out;
  }

  out.fully_qualified_name = same_package;
  out.resolution           = Resolution::kUnresolved;
  return out;
}

// ---------------------------------------------------------------------
// Type text helpers
// ---------------------------------------------------------------------

std::string ExtractSimpleClassName(std::string_view fully_qualified_name) {
  auto pos = fully_qualified_name.rfind('.');
  return std::string(pos == std::string_view::npos ? fully_qualified_name : fully_qualified_name.substr(pos + 1));
}

std::string StripTypeDecorations(std::string_view type_declaration) {
  auto text = util::Trim(type_declaration);
  if (auto pos = text.find('<'); pos != std::string::npos) text.resize(pos);
  if (auto pos = text.find('['); pos != std::string::npos) text.resize(pos);
  if (text.ends_with("...")) text.resize(text.size() - 3);
  return util::Trim(text);
}

std::string ExtractSimpleTypeName(std::string_view type_declaration) {
  return ExtractSimpleClassName(StripTypeDecorations(type_declaration));
}

std::string ExtractPackageName(std::string_view fully_qualified_name) {
  auto pos = fully_qualified_name.rfind('.');
  return pos == std::string_view::npos ? std::string() : std::string(fully_qualified_name.substr(0, pos));
}

bool IsPrimitiveType(std::string_view type_name) {
  static constexpr std::array<std::string_view, 9> kPrimitives = {"int", "long", "double", "float", "boolean", "char", "byte", "short", "void"};
  for (auto primitive : kPrimitives) {
    if (type_name == primitive) return true;
  }
  return false;
}

bool IsExternalClass(std::string_view fully_qualified_name) {
  static constexpr std::array<std::string_view, 9> kPrefixes = {"java.",      "javax.",      "org.springframework.", "org.slf4j.", "com.fasterxml.jackson.",
                                                                "org.apache.", "com.google.", "jakarta.",             "org.junit."};
  for (auto prefix : kPrefixes) {
    if (fully_qualified_name.starts_with(prefix)) return true;
  }
  return false;
}

std::string BuiltinQualifiedName(std::string_view simple_name) {
  const auto& builtins = BuiltinTypes();
  auto        it       = builtins.find(simple_name);
  return it == builtins.end() ? std::string() : it->second;
}

std::vector<std::string> SplitTypeArguments(std::string_view type_declaration) {
  std::vector<std::string> out;

  auto open = type_declaration.find('<');
  if (open == std::string_view::npos) return out;

  int         depth = 0;
  std::string current;
  for (std::size_t i = open + 1; i < type_declaration.size(); ++i) {
    char c = type_declaration[i];
    if (c == '<') {
      ++depth;
    } else if (c == '>') {
      if (depth == 0) break;
      --depth;
    } else if (c == ',' && depth == 0) {
      if (auto arg = util::Trim(current); !arg.empty()) out.push_back(std::move(arg));
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  if (auto arg = util::Trim(current); !arg.empty()) out.push_back(std::move(arg));
  return out;
}

std::vector<std::string> ExtractGenericTypeArguments(std::string_view type_declaration) {
  std::vector<std::string> out;
  for (auto& arg : SplitTypeArguments(type_declaration)) {
    if (arg == "?") continue;
    if (arg.starts_with('?')) {
      out.push_back(std::move(arg));
      continue;
    }

    auto outer = arg.substr(0, arg.find('<'));
    outer      = util::Trim(outer);
    if (outer.empty() || IsPrimitiveType(ExtractSimpleTypeName(outer))) continue;
    out.push_back(std::move(outer));
  }
  return out;
}

std::string WildcardBound(std::string_view type_argument) {
  auto text = util::Trim(type_argument);
  if (!text.starts_with('?')) return text;

  auto rest = util::Trim(std::string_view(text).substr(1));
  for (std::string_view keyword : {std::string_view("extends"), std::string_view("super")}) {
    if (rest.starts_with(keyword)) {
      return util::Trim(std::string_view(rest).substr(keyword.size()));
    }
  }
  return text;
}

} // namespace codegraph::resolve
