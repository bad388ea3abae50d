#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codegraph::resolve {

/*
  Import declarations of one compilation unit.

  Accepts the parser's spelling: "a.b.C", "a.b.*", "static a.b.C.m",
  "static a.b.C.*".
*/
class ImportTable {
 public:
  static ImportTable Parse(const std::vector<std::string>& declarations);

  // Fully-qualified name imported under `simple_name`, if any.
  std::optional<std::string> Lookup(std::string_view simple_name) const;

  // Owning class of a statically imported member.
  std::optional<std::string> LookupStaticMember(std::string_view member) const;

  const std::vector<std::string>& WildcardPackages() const {
    return wildcard_packages_;
  }

  // Single-type imports in declaration order, without duplicates.
  const std::vector<std::string>& ImportedTypes() const {
    return imported_types_;
  }

  bool Empty() const {
    return types_.empty() && wildcard_packages_.empty();
  }

 private:
  void AddType(const std::string& fqn);

  std::map<std::string, std::string, std::less<>> types_;
  std::map<std::string, std::string, std::less<>> static_members_;
  std::vector<std::string>                        wildcard_packages_;
  std::vector<std::string>                        imported_types_;
};

} // namespace codegraph::resolve
