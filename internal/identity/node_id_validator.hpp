#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/node_kind.hpp"

namespace codegraph::identity {

struct ValidationResult {
  bool        valid = false;
  std::string message;
};

enum class RiskLevel : std::uint8_t {
  kLow,
  kMedium,
  kHigh,
  kUnknown,
};

constexpr std::string_view ToString(RiskLevel level) {
  switch (level) {
    case RiskLevel::kLow:
      return "LOW";
    case RiskLevel::kMedium:
      return "MEDIUM";
    case RiskLevel::kHigh:
      return "HIGH";
    case RiskLevel::kUnknown:
      return "UNKNOWN";
  }
  return "UNKNOWN";
}

struct CollisionAnalysis {
  RiskLevel   level = RiskLevel::kUnknown;
  std::string reason;
};

// Full-format check of an id against its kind's layout.
ValidationResult ValidateStrict(std::string_view node_id, model::NodeKind kind);

// Heuristic estimate of how likely two distinct entities share this id.
CollisionAnalysis AnalyzeCollisionRisk(std::string_view node_id, model::NodeKind kind);

} // namespace codegraph::identity
