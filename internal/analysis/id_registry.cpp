#include "internal/analysis/id_registry.hpp"

#include <variant>

#include "internal/identity/node_identifier.hpp"

namespace codegraph::analysis {

void IdRegistry::Register(const model::EntityNode& node) {
  ids_.insert(model::IdOf(node));

  if (const auto* cls = std::get_if<model::ClassNode>(&node)) {
    classes_by_fqn_.emplace(cls->fully_qualified_name, cls->id);
    return;
  }

  if (const auto* method = std::get_if<model::MethodNode>(&node)) {
    auto class_id = identity::GenerateClassId(method->package_name, method->class_name);
    auto& entries = methods_by_class_[class_id];
    for (const auto& entry : entries) {
      if (entry.id == method->id) return;
    }
    entries.push_back({method->id, method->name, method->parameter_types.size()});
    return;
  }

  if (const auto* field = std::get_if<model::FieldNode>(&node)) {
    auto class_id = identity::GenerateClassId(field->package_name, field->class_name);
    fields_by_class_[class_id].emplace(field->name, FieldEntry{field->id, field->type});
  }
}

bool IdRegistry::Contains(const std::string& id) const {
  return ids_.contains(id);
}

std::optional<std::string> IdRegistry::ClassIdFor(const std::string& fully_qualified_name) const {
  auto it = classes_by_fqn_.find(fully_qualified_name);
  if (it == classes_by_fqn_.end()) return std::nullopt;
  return it->second;
}

std::vector<IdRegistry::MethodEntry> IdRegistry::FindMethods(const std::string& class_id, const std::string& name,
                                                             std::size_t argument_count) const {
  std::vector<MethodEntry> out;
  auto                     it = methods_by_class_.find(class_id);
  if (it == methods_by_class_.end()) return out;
  for (const auto& entry : it->second) {
    if (entry.name == name && entry.parameter_count == argument_count) out.push_back(entry);
  }
  return out;
}

std::optional<IdRegistry::FieldEntry> IdRegistry::FindField(const std::string& class_id, const std::string& name) const {
  auto cls = fields_by_class_.find(class_id);
  if (cls == fields_by_class_.end()) return std::nullopt;
  auto it = cls->second.find(name);
  if (it == cls->second.end()) return std::nullopt;
  return it->second;
}

} // namespace codegraph::analysis
