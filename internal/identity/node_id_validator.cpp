#include "internal/identity/node_id_validator.hpp"

#include <regex>
#include <utility>

#include "internal/identity/node_identifier.hpp"
#include "internal/util/strings.hpp"

namespace codegraph::identity {

namespace {

using model::NodeKind;

const std::regex& PatternFor(NodeKind kind) {
  static const std::regex kPackage(R"(^package:[^:]*$)");
  static const std::regex kClass(R"(^class:[^:]*:[^:]+$)");
  static const std::regex kMethod(R"(^method:[^:]*:[^:]+:[^:]+:([a-f0-9]{8}|void)$)");
  static const std::regex kField(R"(^field:[^:]*:[^:]+:[^:]+:[^:]*$)");
  static const std::regex kAnnotation(R"(^annotation:[^:]+$)");
  static const std::regex kModule(R"(^module:repo:[^:]+:[a-f0-9]+:[^:]*$)");
  static const std::regex kRepository(R"(^repo:[^:]+:[a-f0-9]+$)");

  switch (kind) {
    case NodeKind::kPackage:
      return kPackage;
    case NodeKind::kClass:
      return kClass;
    case NodeKind::kMethod:
      return kMethod;
    case NodeKind::kField:
      return kField;
    case NodeKind::kAnnotation:
      return kAnnotation;
    case NodeKind::kModule:
      return kModule;
    case NodeKind::kRepository:
      return kRepository;
  }
  return kRepository;
}

CollisionAnalysis Low(std::string reason) {
  return {RiskLevel::kLow, std::move(reason)};
}

CollisionAnalysis Medium(std::string reason) {
  return {RiskLevel::kMedium, std::move(reason)};
}

CollisionAnalysis High(std::string reason) {
  return {RiskLevel::kHigh, std::move(reason)};
}

} // namespace

ValidationResult ValidateStrict(std::string_view node_id, NodeKind kind) {
  if (util::Trim(node_id).empty()) {
    return {false, "Node ID cannot be null or empty"};
  }
  if (!std::regex_match(node_id.begin(), node_id.end(), PatternFor(kind))) {
    return {false, "Invalid format for " + std::string(model::ToString(kind)) + " node ID: " + std::string(node_id)};
  }
  return {true, {}};
}

CollisionAnalysis AnalyzeCollisionRisk(std::string_view node_id, NodeKind kind) {
  if (!ValidateStrict(node_id, kind).valid) {
    return {RiskLevel::kUnknown, "Cannot analyze invalid ID"};
  }

  auto parts = util::Split(node_id, ':');

  switch (kind) {
    case NodeKind::kClass: {
      const auto& package_name = parts[1];
      const auto& class_name   = parts[2];
      if (package_name.empty() && class_name.size() < 3) return Medium("Short class name in default package");
      if (class_name.size() < 2) return Medium("Very short class name");
      return Low("Well-formed package and class name");
    }
    case NodeKind::kMethod: {
      if (parts[3].size() < 2) return Medium("Very short method name");
      return Low("Well-formed method signature with hash");
    }
    case NodeKind::kField: {
      if (parts[3].size() < 2) return Medium("Very short field name");
      return Low("Well-formed field identifier");
    }
    case NodeKind::kPackage: {
      auto package_name = node_id.substr(kPackagePrefix.size());
      if (package_name.empty()) return High("Default package has high collision risk");
      if (package_name.find('.') == std::string_view::npos) return Medium("Single-level package name");
      return Low("Multi-level package name");
    }
    case NodeKind::kRepository: {
      if (parts[1].size() < 3) return Medium("Short repository name");
      if (parts[2].size() < 8) return Medium("Short path hash");
      return Low("Well-formed repository identifier with path hash");
    }
    case NodeKind::kModule: {
      if (parts.size() < 5 || parts[4].empty()) return Medium("Module at repository root");
      return Low("Well-formed module identifier");
    }
    case NodeKind::kAnnotation: {
      auto name = node_id.substr(kAnnotationPrefix.size());
      if (name.find('.') == std::string_view::npos) return Medium("Annotation without package qualifier");
      if (name.size() < 5) return Medium("Very short annotation name");
      return Low("Well-formed fully qualified annotation name");
    }
  }
  return {RiskLevel::kUnknown, "Unknown node type"};
}

} // namespace codegraph::identity
