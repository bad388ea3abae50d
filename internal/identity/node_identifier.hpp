#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/node.hpp"

namespace codegraph::identity {

/*
  Deterministic node identifiers.

  Every id is a pure function of the entity's natural key: no clock,
  no randomness, no lookup of persisted state. Re-deriving an id from
  the same declaration always yields the same string, which is what
  makes re-ingestion converge instead of duplicating nodes.

  Required key parts (names, owning ids) throw util::InvalidArgument
  when empty; package and path parts accept empty and contribute an
  empty segment (default package, repository root).
*/

inline constexpr std::string_view kClassPrefix      = "class:";
inline constexpr std::string_view kMethodPrefix     = "method:";
inline constexpr std::string_view kFieldPrefix      = "field:";
inline constexpr std::string_view kPackagePrefix    = "package:";
inline constexpr std::string_view kAnnotationPrefix = "annotation:";
inline constexpr std::string_view kModulePrefix     = "module:";
inline constexpr std::string_view kRepositoryPrefix = "repo:";
inline constexpr std::string_view kAuditPrefix      = "upsert_audit:";

std::string GenerateClassId(std::string_view package_name, std::string_view class_name);

// `class_id` is the owning class id; parameter names never take part.
std::string GenerateMethodId(std::string_view class_id, std::string_view method_name, const std::vector<std::string>& parameter_types);

std::string GenerateFieldId(std::string_view class_id, std::string_view field_name, std::string_view field_type);

std::string GeneratePackageId(std::string_view package_name);

std::string GenerateAnnotationId(std::string_view package_name, std::string_view annotation_name);

std::string GenerateRepositoryId(std::string_view repository_path, std::string_view repository_name);

std::string GenerateModuleId(std::string_view repository_id, std::string_view module_path);

std::string GenerateAuditId(std::string_view operation_id, std::string_view node_kind, std::string_view node_id);

// ---------------------------------------------------------------------
// Normalization
// ---------------------------------------------------------------------

// "Com.Example Service" -> "com.example.service"
std::string NormalizePackageName(std::string_view package_name);

// "C:\\a\\b" -> "C:/a/b", "/a//b/" -> "a/b"
std::string NormalizeFilePath(std::string_view file_path);

// Trims and replaces inner whitespace runs with '_'. Case is preserved.
std::string NormalizeSimpleName(std::string_view name);

/*
  Erasure-like spelling of a type used for hashing and field ids:
  whitespace removed, generic arguments collapsed to <T>, varargs
  written as [], empty becomes "Object". Boxed and primitive spellings
  stay distinct ("int" != "Integer").
*/
std::string NormalizeTypeName(std::string_view type_name);

// "name(T1,T2)" over normalized parameter types.
std::string NormalizeMethodSignature(std::string_view method_name, const std::vector<std::string>& parameter_types);

// 8 hex chars of MD5 over the joined normalized types, or "void".
std::string ParameterHash(const std::vector<std::string>& parameter_types);

// ---------------------------------------------------------------------
// Checks
// ---------------------------------------------------------------------

// Expected prefix and a non-empty body; the default package id
// "package:" is the one legal empty body.
bool ValidateNodeId(std::string_view node_id, model::NodeKind kind);

std::optional<model::NodeKind> ExtractNodeKind(std::string_view node_id);

std::string_view PrefixFor(model::NodeKind kind);

// True only when both nodes are present and carry the same id.
bool IsConsistentId(const model::EntityNode* existing, const model::EntityNode* incoming);

} // namespace codegraph::identity
