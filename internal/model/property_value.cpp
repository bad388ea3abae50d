#include "internal/model/property_value.hpp"

#include <type_traits>

namespace codegraph::model {

std::string_view TypeName(const PropertyValue& value) {
  switch (value.index()) {
    case 0:
      return "bool";
    case 1:
      return "int";
    case 2:
      return "string";
    case 3:
      return "list";
    default:
      return "map";
  }
}

std::string ToDisplayString(const PropertyValue& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return std::to_string(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else if constexpr (std::is_same_v<T, StringList>) {
          std::string out = "[";
          for (std::size_t i = 0; i < v.size(); ++i) {
            if (i > 0) out += ",";
            out += v[i];
          }
          return out + "]";
        } else {
          std::string out   = "{";
          bool        first = true;
          for (const auto& [key, item] : v) {
            if (!first) out += ",";
            first = false;
            out += key + "=" + item;
          }
          return out + "}";
        }
      },
      value);
}

} // namespace codegraph::model
