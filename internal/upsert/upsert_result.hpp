#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/node_kind.hpp"

namespace codegraph::upsert {

enum class OperationType : std::uint8_t {
  kInsert,
  kUpdate,
  kSkip,
};

constexpr std::string_view ToString(OperationType type) {
  switch (type) {
    case OperationType::kInsert:
      return "INSERT";
    case OperationType::kUpdate:
      return "UPDATE";
    case OperationType::kSkip:
      return "SKIP";
  }
  return "SKIP";
}

// Class of failure captured in a result; kNone on success.
enum class ErrorKind : std::uint8_t {
  kNone,
  kInvalidArgument,
  kNotFound,
  kAlreadyExists,
  kConflict,
};

constexpr std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "NONE";
    case ErrorKind::kInvalidArgument:
      return "INVALID_ARGUMENT";
    case ErrorKind::kNotFound:
      return "NOT_FOUND";
    case ErrorKind::kAlreadyExists:
      return "ALREADY_EXISTS";
    case ErrorKind::kConflict:
      return "CONFLICT";
  }
  return "CONFLICT";
}

/*
  Outcome of one node's reconciliation.

  A failed result still carries the operation that was attempted
  (INSERT for a missing node, UPDATE for an existing one).
*/
struct UpsertResult {
  std::string     node_id;
  model::NodeKind node_kind      = model::NodeKind::kClass;
  OperationType   operation_type = OperationType::kSkip;
  bool            success        = false;
  ErrorKind       error_kind     = ErrorKind::kNone;
  std::string     error_message;
  std::string     timestamp;
  double          processing_time_ms = 0.0;

  // significant property names that differed, sorted
  std::vector<std::string> changed_properties;
  std::size_t              property_count = 0;

  std::string operation_id;
};

} // namespace codegraph::upsert
