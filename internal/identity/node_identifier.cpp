#include "internal/identity/node_identifier.hpp"

#include <cctype>

#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace codegraph::identity {

namespace {

void RequireNonEmpty(std::string_view value, const char* param) {
  if (util::Trim(value).empty()) {
    throw util::InvalidArgument(std::string(param) + " cannot be null or empty");
  }
}

// Collapses runs of separator characters into `sep` and strips it at both ends.
template <typename IsSeparator>
std::string CollapseSeparators(std::string_view input, char sep, IsSeparator is_separator) {
  std::string out;
  out.reserve(input.size());
  bool pending = false;
  for (char c : input) {
    if (is_separator(c)) {
      pending = true;
      continue;
    }
    if (pending && !out.empty()) out.push_back(sep);
    pending = false;
    out.push_back(c);
  }
  return out;
}

struct ClassKey {
  std::string package_name;
  std::string class_name;
};

ClassKey SplitClassId(std::string_view class_id) {
  if (!class_id.starts_with(kClassPrefix)) {
    throw util::InvalidArgument("Invalid class ID format: " + std::string(class_id));
  }
  auto body = class_id.substr(kClassPrefix.size());
  auto pos  = body.find(':');
  if (pos == std::string_view::npos) {
    return {std::string(body), {}};
  }
  return {std::string(body.substr(0, pos)), std::string(body.substr(pos + 1))};
}

} // namespace

std::string GenerateClassId(std::string_view package_name, std::string_view class_name) {
  RequireNonEmpty(class_name, "className");
  return std::string(kClassPrefix) + NormalizePackageName(package_name) + ":" + NormalizeSimpleName(class_name);
}

std::string GenerateMethodId(std::string_view class_id, std::string_view method_name, const std::vector<std::string>& parameter_types) {
  RequireNonEmpty(class_id, "classId");
  RequireNonEmpty(method_name, "methodName");

  auto key = SplitClassId(class_id);
  return std::string(kMethodPrefix) + key.package_name + ":" + key.class_name + ":" + NormalizeSimpleName(method_name) + ":" +
         ParameterHash(parameter_types);
}

std::string GenerateFieldId(std::string_view class_id, std::string_view field_name, std::string_view field_type) {
  RequireNonEmpty(class_id, "classId");
  RequireNonEmpty(field_name, "fieldName");

  auto key = SplitClassId(class_id);
  return std::string(kFieldPrefix) + key.package_name + ":" + key.class_name + ":" + NormalizeSimpleName(field_name) + ":" +
         NormalizeTypeName(field_type);
}

std::string GeneratePackageId(std::string_view package_name) {
  return std::string(kPackagePrefix) + NormalizePackageName(package_name);
}

std::string GenerateAnnotationId(std::string_view package_name, std::string_view annotation_name) {
  RequireNonEmpty(annotation_name, "annotationName");

  auto package    = NormalizePackageName(package_name);
  auto annotation = NormalizeSimpleName(annotation_name);
  return std::string(kAnnotationPrefix) + (package.empty() ? annotation : package + "." + annotation);
}

std::string GenerateRepositoryId(std::string_view repository_path, std::string_view repository_name) {
  RequireNonEmpty(repository_name, "repositoryName");
  RequireNonEmpty(repository_path, "repositoryPath");
  return std::string(kRepositoryPrefix) + NormalizeSimpleName(repository_name) + ":" + util::Md5HexPrefix(NormalizeFilePath(repository_path));
}

std::string GenerateModuleId(std::string_view repository_id, std::string_view module_path) {
  RequireNonEmpty(repository_id, "repositoryId");
  return std::string(kModulePrefix) + std::string(repository_id) + ":" + NormalizeFilePath(module_path);
}

std::string GenerateAuditId(std::string_view operation_id, std::string_view node_kind, std::string_view node_id) {
  RequireNonEmpty(operation_id, "operationId");
  RequireNonEmpty(node_kind, "nodeType");
  RequireNonEmpty(node_id, "nodeId");
  return std::string(kAuditPrefix) + std::string(operation_id) + ":" + std::string(node_kind) + ":" + std::string(node_id);
}

// ---------------------------------------------------------------------
// Normalization
// ---------------------------------------------------------------------

std::string NormalizePackageName(std::string_view package_name) {
  auto lowered = util::ToLower(util::Trim(package_name));
  return CollapseSeparators(lowered, '.', [](char c) { return c == '.' || c == '\\' || std::isspace(static_cast<unsigned char>(c)); });
}

std::string NormalizeFilePath(std::string_view file_path) {
  auto trimmed = util::Trim(file_path);
  return CollapseSeparators(trimmed, '/', [](char c) { return c == '/' || c == '\\'; });
}

std::string NormalizeSimpleName(std::string_view name) {
  auto        trimmed = util::Trim(name);
  std::string out;
  out.reserve(trimmed.size());
  bool in_space = false;
  for (char c : trimmed) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!in_space) out.push_back('_');
      in_space = true;
      continue;
    }
    in_space = false;
    out.push_back(c);
  }
  return out;
}

std::string NormalizeTypeName(std::string_view type_name) {
  std::string compact;
  compact.reserve(type_name.size());
  for (char c : type_name) {
    if (!std::isspace(static_cast<unsigned char>(c))) compact.push_back(c);
  }
  if (compact.empty()) return "Object";

  std::string out;
  out.reserve(compact.size());
  int depth = 0;
  for (std::size_t i = 0; i < compact.size(); ++i) {
    char c = compact[i];
    if (c == '<') {
      if (depth == 0) out += "<T>";
      ++depth;
      continue;
    }
    if (c == '>') {
      if (depth > 0) --depth;
      continue;
    }
    if (depth > 0) continue;
    if (c == '.' && compact.compare(i, 3, "...") == 0) {
      out += "[]";
      i += 2;
      continue;
    }
    out.push_back(c);
  }
  return out;
}

std::string NormalizeMethodSignature(std::string_view method_name, const std::vector<std::string>& parameter_types) {
  std::vector<std::string> normalized;
  normalized.reserve(parameter_types.size());
  for (const auto& type : parameter_types) normalized.push_back(NormalizeTypeName(type));
  return NormalizeSimpleName(method_name) + "(" + util::Join(normalized, ",") + ")";
}

std::string ParameterHash(const std::vector<std::string>& parameter_types) {
  if (parameter_types.empty()) return "void";

  std::vector<std::string> normalized;
  normalized.reserve(parameter_types.size());
  for (const auto& type : parameter_types) normalized.push_back(NormalizeTypeName(type));
  return util::Md5HexPrefix(util::Join(normalized, ","));
}

// ---------------------------------------------------------------------
// Checks
// ---------------------------------------------------------------------

std::string_view PrefixFor(model::NodeKind kind) {
  switch (kind) {
    case model::NodeKind::kPackage:
      return kPackagePrefix;
    case model::NodeKind::kClass:
      return kClassPrefix;
    case model::NodeKind::kMethod:
      return kMethodPrefix;
    case model::NodeKind::kField:
      return kFieldPrefix;
    case model::NodeKind::kAnnotation:
      return kAnnotationPrefix;
    case model::NodeKind::kModule:
      return kModulePrefix;
    case model::NodeKind::kRepository:
      return kRepositoryPrefix;
  }
  return kRepositoryPrefix;
}

bool ValidateNodeId(std::string_view node_id, model::NodeKind kind) {
  if (util::Trim(node_id).empty()) return false;

  auto prefix = PrefixFor(kind);
  if (!node_id.starts_with(prefix)) return false;
  if (kind == model::NodeKind::kPackage) return true;
  return node_id.size() > prefix.size();
}

std::optional<model::NodeKind> ExtractNodeKind(std::string_view node_id) {
  if (node_id.starts_with(kClassPrefix)) return model::NodeKind::kClass;
  if (node_id.starts_with(kMethodPrefix)) return model::NodeKind::kMethod;
  if (node_id.starts_with(kFieldPrefix)) return model::NodeKind::kField;
  if (node_id.starts_with(kPackagePrefix)) return model::NodeKind::kPackage;
  if (node_id.starts_with(kAnnotationPrefix)) return model::NodeKind::kAnnotation;
  if (node_id.starts_with(kModulePrefix)) return model::NodeKind::kModule;
  if (node_id.starts_with(kRepositoryPrefix)) return model::NodeKind::kRepository;
  return std::nullopt;
}

bool IsConsistentId(const model::EntityNode* existing, const model::EntityNode* incoming) {
  if (existing == nullptr || incoming == nullptr) return false;
  return model::IdOf(*existing) == model::IdOf(*incoming);
}

} // namespace codegraph::identity
