#include "internal/resolve/import_table.hpp"

#include <algorithm>

#include "internal/util/strings.hpp"

namespace codegraph::resolve {

namespace {

std::string SimpleNameOf(const std::string& fqn) {
  auto pos = fqn.rfind('.');
  return pos == std::string::npos ? fqn : fqn.substr(pos + 1);
}

} // namespace

ImportTable ImportTable::Parse(const std::vector<std::string>& declarations) {
  ImportTable table;

  for (const auto& raw : declarations) {
    auto decl = util::Trim(raw);
    if (decl.ends_with(';')) decl = util::Trim(decl.substr(0, decl.size() - 1));
    if (decl.empty()) continue;

    bool is_static = false;
    if (decl.starts_with("static ")) {
      is_static = true;
      decl      = util::Trim(decl.substr(7));
    }

    if (decl.ends_with(".*")) {
      auto owner = decl.substr(0, decl.size() - 2);
      if (is_static) {
        table.AddType(owner);
      } else if (std::find(table.wildcard_packages_.begin(), table.wildcard_packages_.end(), owner) == table.wildcard_packages_.end()) {
        table.wildcard_packages_.push_back(owner);
      }
      continue;
    }

    if (is_static) {
      auto pos = decl.rfind('.');
      if (pos == std::string::npos) continue;
      auto owner = decl.substr(0, pos);
      table.static_members_[decl.substr(pos + 1)] = owner;
      table.AddType(owner);
      continue;
    }

    table.AddType(decl);
  }

  return table;
}

void ImportTable::AddType(const std::string& fqn) {
  auto simple = SimpleNameOf(fqn);
  if (simple.empty()) return;
  // first declaration wins for a clashing simple name
  if (types_.emplace(simple, fqn).second) {
    imported_types_.push_back(fqn);
  }
}

std::optional<std::string> ImportTable::Lookup(std::string_view simple_name) const {
  auto it = types_.find(simple_name);
  if (it == types_.end()) return std::nullopt;
  return it->second;
}

std::optional<std::string> ImportTable::LookupStaticMember(std::string_view member) const {
  auto it = static_members_.find(member);
  if (it == static_members_.end()) return std::nullopt;
  return it->second;
}

} // namespace codegraph::resolve
