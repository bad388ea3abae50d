#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "internal/model/node_kind.hpp"
#include "internal/model/property_value.hpp"

namespace codegraph::model {

struct PackageNode {
  std::string id;
  std::string name;
  std::string path;

  std::string created_at;
  std::string updated_at;
};

struct ClassNode {
  std::string id;
  std::string name;
  std::string visibility;
  StringList  modifiers;

  bool is_interface  = false;
  bool is_enum       = false;
  bool is_annotation = false;
  bool is_external   = false;

  std::string  file_path;
  std::int64_t line_start = 0;
  std::int64_t line_end   = 0;

  std::string package_name;
  std::string fully_qualified_name;
  std::string superclass;
  StringList  interfaces;

  std::string repository_id;
  std::string module_id;

  std::string created_at;
  std::string updated_at;
};

struct MethodNode {
  std::string id;
  std::string name;
  std::string visibility;
  StringList  modifiers;
  std::string return_type;

  // "Type name" pairs, declaration order
  StringList parameters;
  StringList parameter_types;
  StringList parameter_names;

  std::string  file_path;
  std::int64_t line_start = 0;
  std::int64_t line_end   = 0;

  std::string class_name;
  std::string package_name;

  std::string created_at;
  std::string updated_at;
};

struct FieldNode {
  std::string id;
  std::string name;
  std::string visibility;
  StringList  modifiers;
  std::string type;

  std::string  file_path;
  std::int64_t line_number = 0;

  std::string class_name;
  std::string package_name;

  std::string created_at;
  std::string updated_at;
};

struct AnnotationNode {
  std::string id;
  std::string name;
  std::string fully_qualified_name;
  StringMap   attributes;
  std::string target_type;
  bool        is_framework = false;
  std::string framework_type;

  std::string created_at;
  std::string updated_at;
};

struct ModuleNode {
  std::string id;
  std::string name;
  std::string path;
  std::string type;
  std::string build_file;
  StringList  source_directories;
  StringList  test_directories;
  StringList  dependencies;
  std::string description;
  std::string version;
  std::string repository_id;

  std::string created_at;
  std::string updated_at;
};

struct RepositoryNode {
  std::string  id;
  std::string  name;
  std::string  organization;
  std::string  url;
  std::string  clone_url;
  std::string  default_branch;
  std::string  last_commit_hash;
  std::string  local_path;
  std::int64_t total_files = 0;

  std::string created_at;
  std::string updated_at;
};

/*
  Closed sum over every entity kind.

  Alternative order matches NodeKind, so the tag is the variant index.
*/
using EntityNode = std::variant<PackageNode, ClassNode, MethodNode, FieldNode, AnnotationNode, ModuleNode, RepositoryNode>;

inline NodeKind KindOf(const EntityNode& node) {
  return static_cast<NodeKind>(node.index());
}

const std::string& IdOf(const EntityNode& node);

/*
  snake_case property view of a node.

  Empty strings and empty collections are omitted so that a value
  appearing or disappearing compares as ADDED/REMOVED. Booleans and
  integers are always present.
*/
PropertyMap ToProperties(const EntityNode& node);

// Inverse of ToProperties. Missing keys take the field default.
EntityNode FromProperties(NodeKind kind, const PropertyMap& properties);

// Properties whose change never triggers an update.
bool IsInsignificantProperty(const std::string& key);

// Multi-valued properties compared as sets rather than sequences.
bool IsUnorderedProperty(const std::string& key);

} // namespace codegraph::model
