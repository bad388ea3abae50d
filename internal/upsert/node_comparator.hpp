#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/api/types.hpp"
#include "internal/model/node.hpp"

namespace codegraph::upsert {

enum class ComparisonOutcome : std::uint8_t {
  kIdentical,
  kPropertiesChanged,
  kStructureChanged,
  kConflict,
};

constexpr std::string_view ToString(ComparisonOutcome outcome) {
  switch (outcome) {
    case ComparisonOutcome::kIdentical:
      return "IDENTICAL";
    case ComparisonOutcome::kPropertiesChanged:
      return "PROPERTIES_CHANGED";
    case ComparisonOutcome::kStructureChanged:
      return "STRUCTURE_CHANGED";
    case ComparisonOutcome::kConflict:
      return "CONFLICT";
  }
  return "CONFLICT";
}

enum class ChangeType : std::uint8_t {
  kAdded,
  kRemoved,
  kModified,
  kTypeChanged,
};

constexpr std::string_view ToString(ChangeType type) {
  switch (type) {
    case ChangeType::kAdded:
      return "ADDED";
    case ChangeType::kRemoved:
      return "REMOVED";
    case ChangeType::kModified:
      return "MODIFIED";
    case ChangeType::kTypeChanged:
      return "TYPE_CHANGED";
  }
  return "TYPE_CHANGED";
}

struct PropertyChange {
  ChangeType                          type = ChangeType::kModified;
  std::optional<model::PropertyValue> old_value;
  std::optional<model::PropertyValue> new_value;
  bool                                significant = true;
};

struct ComparisonResult {
  ComparisonOutcome                     outcome = ComparisonOutcome::kIdentical;
  std::map<std::string, PropertyChange> changes;
  bool                                  requires_update = false;
  std::string                           conflict_reason;

  std::size_t SignificantChangeCount() const;
};

/*
  Property-by-property diff of a persisted node against an incoming one.

  - Different kinds under one id is a CONFLICT, never a change.
  - A key present on one side only is ADDED or REMOVED.
  - modifiers, interfaces and directory/dependency lists compare as
    sets; parameter lists compare as sequences.
  - created_at/updated_at never make a node differ. They appear in
    `changes` (as insignificant) only when both sides carry them.
*/
ComparisonResult CompareProperties(model::NodeKind existing_kind, const model::PropertyMap& existing, model::NodeKind incoming_kind,
                                   const model::PropertyMap& incoming);

ComparisonResult CompareNodes(const db::StoredNode& existing, const model::EntityNode& incoming);

ComparisonResult CompareNodes(const model::EntityNode& existing, const model::EntityNode& incoming);

} // namespace codegraph::upsert
