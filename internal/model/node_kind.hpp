#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace codegraph::model {

// Order matches the alternatives of EntityNode.
enum class NodeKind : std::uint8_t {
  kPackage    = 0,
  kClass      = 1,
  kMethod     = 2,
  kField      = 3,
  kAnnotation = 4,
  kModule     = 5,
  kRepository = 6,
};

// Graph label the node is persisted under.
constexpr std::string_view ToString(NodeKind kind) {
  switch (kind) {
    case NodeKind::kPackage:
      return "Package";
    case NodeKind::kClass:
      return "Class";
    case NodeKind::kMethod:
      return "Method";
    case NodeKind::kField:
      return "Field";
    case NodeKind::kAnnotation:
      return "Annotation";
    case NodeKind::kModule:
      return "Module";
    case NodeKind::kRepository:
      return "Repository";
  }
  return "Repository";
}

constexpr std::optional<NodeKind> ParseNodeKind(std::string_view label) {
  if (label == "Package") return NodeKind::kPackage;
  if (label == "Class") return NodeKind::kClass;
  if (label == "Method") return NodeKind::kMethod;
  if (label == "Field") return NodeKind::kField;
  if (label == "Annotation") return NodeKind::kAnnotation;
  if (label == "Module") return NodeKind::kModule;
  if (label == "Repository") return NodeKind::kRepository;
  return std::nullopt;
}

} // namespace codegraph::model
