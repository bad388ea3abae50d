#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/property_value.hpp"

namespace codegraph::model {

enum class UpsertMode : std::uint8_t {
  kInsertOnly,
  kUpsert,
  kUpdateOnly,
};

constexpr std::string_view ToString(UpsertMode mode) {
  switch (mode) {
    case UpsertMode::kInsertOnly:
      return "insert_only";
    case UpsertMode::kUpdateOnly:
      return "update_only";
    case UpsertMode::kUpsert:
      return "upsert";
  }
  return "upsert";
}

constexpr bool AllowsInsert(UpsertMode mode) {
  return mode != UpsertMode::kUpdateOnly;
}

constexpr bool AllowsUpdate(UpsertMode mode) {
  return mode != UpsertMode::kInsertOnly;
}

/*
  Parses a configured mode. Trimmed, case-insensitive; empty means
  kUpsert. Throws util::InvalidConfiguration for anything else.
*/
UpsertMode ParseUpsertMode(std::string_view value);

// Tie-break for an annotation attribute seen with different values.
enum class AttributePolicy : std::uint8_t {
  kFirstSeen,
  kLastSeen,
};

constexpr std::string_view ToString(AttributePolicy policy) {
  return policy == AttributePolicy::kLastSeen ? "last_seen" : "first_seen";
}

// Same normalization as ParseUpsertMode; empty means kFirstSeen.
AttributePolicy ParseAttributePolicy(std::string_view value);

// Folds `incoming` into `existing` under `policy`.
void MergeAttributes(StringMap& existing, const StringMap& incoming, AttributePolicy policy);

} // namespace codegraph::model
