#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/property_value.hpp"

namespace codegraph::model {

enum class EdgeType : std::uint8_t {
  kContains   = 0,
  kExtends    = 1,
  kImplements = 2,
  kCalls      = 3,
  kUses       = 4,
};

constexpr std::string_view ToString(EdgeType type) {
  switch (type) {
    case EdgeType::kContains:
      return "CONTAINS";
    case EdgeType::kExtends:
      return "EXTENDS";
    case EdgeType::kImplements:
      return "IMPLEMENTS";
    case EdgeType::kCalls:
      return "CALLS";
    case EdgeType::kUses:
      return "USES";
  }
  return "USES";
}

constexpr std::optional<EdgeType> ParseEdgeType(std::string_view name) {
  if (name == "CONTAINS") return EdgeType::kContains;
  if (name == "EXTENDS") return EdgeType::kExtends;
  if (name == "IMPLEMENTS") return EdgeType::kImplements;
  if (name == "CALLS") return EdgeType::kCalls;
  if (name == "USES") return EdgeType::kUses;
  return std::nullopt;
}

// Sub-classification of a USES edge, persisted as properties.kind.
enum class UsesKind : std::uint8_t {
  kImport,
  kInstantiation,
  kMethodCall,
  kFieldAccess,
  kFieldType,
  kGenericParam,
  kAnnotation,
  kMethodReturn,
  kMethodParam,
};

constexpr std::string_view ToString(UsesKind kind) {
  switch (kind) {
    case UsesKind::kImport:
      return "import";
    case UsesKind::kInstantiation:
      return "instantiation";
    case UsesKind::kMethodCall:
      return "method_call";
    case UsesKind::kFieldAccess:
      return "field_access";
    case UsesKind::kFieldType:
      return "field_type";
    case UsesKind::kGenericParam:
      return "generic_param";
    case UsesKind::kAnnotation:
      return "annotation";
    case UsesKind::kMethodReturn:
      return "method_return";
    case UsesKind::kMethodParam:
      return "method_param";
  }
  return "method_param";
}

/*
  Directed relationship between two node ids.

  (from_id, to_id, type, kind, context) is the identity used for
  create-if-absent; the same pair may carry several USES edges that
  differ in kind or context.
*/
struct RelationshipEdge {
  std::string from_id;
  std::string to_id;
  EdgeType    type = EdgeType::kUses;
  std::string kind;
  std::string context;
  PropertyMap properties;
};

} // namespace codegraph::model
