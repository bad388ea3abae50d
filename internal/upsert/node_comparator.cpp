#include "internal/upsert/node_comparator.hpp"

#include <algorithm>
#include <set>
#include <variant>

#include "internal/identity/node_identifier.hpp"

namespace codegraph::upsert {

namespace {

bool SameValue(const std::string& key, const model::PropertyValue& a, const model::PropertyValue& b) {
  if (model::IsUnorderedProperty(key)) {
    if (const auto* left = std::get_if<model::StringList>(&a)) {
      const auto& right = std::get<model::StringList>(b);
      auto        l     = *left;
      auto        r     = right;
      std::sort(l.begin(), l.end());
      std::sort(r.begin(), r.end());
      return l == r;
    }
  }
  return a == b;
}

} // namespace

std::size_t ComparisonResult::SignificantChangeCount() const {
  return static_cast<std::size_t>(std::count_if(changes.begin(), changes.end(), [](const auto& entry) { return entry.second.significant; }));
}

ComparisonResult CompareProperties(model::NodeKind existing_kind, const model::PropertyMap& existing, model::NodeKind incoming_kind,
                                   const model::PropertyMap& incoming) {
  ComparisonResult result;

  if (existing_kind != incoming_kind) {
    result.outcome         = ComparisonOutcome::kConflict;
    result.requires_update = false;
    result.conflict_reason = "Node kind mismatch: existing " + std::string(model::ToString(existing_kind)) + ", incoming " +
                             std::string(model::ToString(incoming_kind));
    return result;
  }

  std::set<std::string> keys;
  for (const auto& [key, value] : existing) keys.insert(key);
  for (const auto& [key, value] : incoming) keys.insert(key);

  bool structure_changed = false;
  for (const auto& key : keys) {
    auto old_it = existing.find(key);
    auto new_it = incoming.find(key);

    const bool had         = old_it != existing.end();
    const bool has         = new_it != incoming.end();
    const bool significant = !model::IsInsignificantProperty(key);

    if (!significant && !(had && has)) continue;

    PropertyChange change;
    change.significant = significant;

    if (had && !has) {
      change.type      = ChangeType::kRemoved;
      change.old_value = old_it->second;
    } else if (!had && has) {
      change.type      = ChangeType::kAdded;
      change.new_value = new_it->second;
    } else {
      const auto& old_value = old_it->second;
      const auto& new_value = new_it->second;
      if (old_value.index() != new_value.index()) {
        change.type = ChangeType::kTypeChanged;
        if (significant) structure_changed = true;
      } else if (!SameValue(key, old_value, new_value)) {
        change.type = ChangeType::kModified;
      } else {
        continue;
      }
      change.old_value = old_value;
      change.new_value = new_value;
    }

    result.changes.emplace(key, std::move(change));
  }

  if (result.SignificantChangeCount() == 0) {
    result.outcome = ComparisonOutcome::kIdentical;
  } else {
    result.outcome         = structure_changed ? ComparisonOutcome::kStructureChanged : ComparisonOutcome::kPropertiesChanged;
    result.requires_update = true;
  }
  return result;
}

ComparisonResult CompareNodes(const db::StoredNode& existing, const model::EntityNode& incoming) {
  auto result = CompareProperties(existing.kind, existing.properties, model::KindOf(incoming), model::ToProperties(incoming));
  if (result.outcome == ComparisonOutcome::kConflict) {
    result.conflict_reason += " for " + existing.id;
  }
  return result;
}

ComparisonResult CompareNodes(const model::EntityNode& existing, const model::EntityNode& incoming) {
  if (!identity::IsConsistentId(&existing, &incoming)) {
    ComparisonResult result;
    result.outcome         = ComparisonOutcome::kConflict;
    result.conflict_reason = "Node id mismatch: " + model::IdOf(existing) + " vs " + model::IdOf(incoming);
    return result;
  }

  auto result = CompareProperties(model::KindOf(existing), model::ToProperties(existing), model::KindOf(incoming), model::ToProperties(incoming));
  if (result.outcome == ComparisonOutcome::kConflict) {
    result.conflict_reason += " for " + model::IdOf(existing);
  }
  return result;
}

} // namespace codegraph::upsert
