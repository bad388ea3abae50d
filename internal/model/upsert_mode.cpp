#include "internal/model/upsert_mode.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace codegraph::model {

UpsertMode ParseUpsertMode(std::string_view value) {
  const auto normalized = util::ToLower(util::Trim(value));
  if (normalized.empty() || normalized == "upsert") return UpsertMode::kUpsert;
  if (normalized == "insert_only") return UpsertMode::kInsertOnly;
  if (normalized == "update_only") return UpsertMode::kUpdateOnly;

  throw util::InvalidConfiguration("Unknown upsert mode: " + std::string(value) + ". Valid values are: insert_only, upsert, update_only");
}

AttributePolicy ParseAttributePolicy(std::string_view value) {
  const auto normalized = util::ToLower(util::Trim(value));
  if (normalized.empty() || normalized == "first_seen") return AttributePolicy::kFirstSeen;
  if (normalized == "last_seen") return AttributePolicy::kLastSeen;

  throw util::InvalidConfiguration("Unknown annotation attribute policy: " + std::string(value) +
                                   ". Valid values are: first_seen, last_seen");
}

void MergeAttributes(StringMap& existing, const StringMap& incoming, AttributePolicy policy) {
  for (const auto& [key, value] : incoming) {
    if (policy == AttributePolicy::kLastSeen) {
      existing[key] = value;
    } else {
      existing.emplace(key, value);
    }
  }
}

} // namespace codegraph::model
