#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace codegraph::model {

using StringList = std::vector<std::string>;
using StringMap  = std::map<std::string, std::string>;

/*
  Typed property value.

  Node properties stay typed from the factory to the store boundary;
  only the SQL backends turn a PropertyMap into JSON text.
*/
using PropertyValue = std::variant<bool, std::int64_t, std::string, StringList, StringMap>;
using PropertyMap   = std::map<std::string, PropertyValue>;

std::string_view TypeName(const PropertyValue& value);

// Human readable rendering used in audit snapshots and logs.
std::string ToDisplayString(const PropertyValue& value);

} // namespace codegraph::model
