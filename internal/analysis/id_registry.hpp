#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/model/node.hpp"

namespace codegraph::analysis {

/*
  Ids minted in the current ingestion.

  Filled single-threaded before analysis starts, then only read; the
  parallel analysis workers share it without locking.
*/
class IdRegistry {
 public:
  struct MethodEntry {
    std::string id;
    std::string name;
    std::size_t parameter_count = 0;
  };

  struct FieldEntry {
    std::string id;
    std::string declared_type;
  };

  void Register(const model::EntityNode& node);

  bool Contains(const std::string& id) const;

  // Class id for a fully-qualified name minted in this ingestion.
  std::optional<std::string> ClassIdFor(const std::string& fully_qualified_name) const;

  bool HasClass(const std::string& fully_qualified_name) const {
    return ClassIdFor(fully_qualified_name).has_value();
  }

  // Methods of `class_id` named `name` taking `argument_count` parameters.
  std::vector<MethodEntry> FindMethods(const std::string& class_id, const std::string& name, std::size_t argument_count) const;

  std::optional<FieldEntry> FindField(const std::string& class_id, const std::string& name) const;

 private:
  std::unordered_set<std::string>                                                ids_;
  std::unordered_map<std::string, std::string>                                   classes_by_fqn_;
  std::unordered_map<std::string, std::vector<MethodEntry>>                      methods_by_class_;
  std::unordered_map<std::string, std::unordered_map<std::string, FieldEntry>> fields_by_class_;
};

} // namespace codegraph::analysis
