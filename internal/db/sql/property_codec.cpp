#include "internal/db/sql/property_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace codegraph::db::sql {

namespace {

void ToValue(const model::PropertyValue& property, google::protobuf::Value* value) {
  std::visit(
      [value](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
          value->set_bool_value(v);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          value->set_number_value(static_cast<double>(v));
        } else if constexpr (std::is_same_v<T, std::string>) {
          value->set_string_value(v);
        } else if constexpr (std::is_same_v<T, model::StringList>) {
          auto* list = value->mutable_list_value();
          for (const auto& item : v) list->add_values()->set_string_value(item);
        } else {
          auto* fields = value->mutable_struct_value()->mutable_fields();
          for (const auto& [key, item] : v) (*fields)[key].set_string_value(item);
        }
      },
      property);
}

model::PropertyValue FromValue(const std::string& key, const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kBoolValue:
      return value.bool_value();
    case google::protobuf::Value::kNumberValue:
      return static_cast<std::int64_t>(std::llround(value.number_value()));
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kListValue: {
      model::StringList list;
      for (const auto& item : value.list_value().values()) {
        if (item.kind_case() != google::protobuf::Value::kStringValue) {
          throw std::runtime_error("property '" + key + "' holds a non-string list element");
        }
        list.push_back(item.string_value());
      }
      return list;
    }
    case google::protobuf::Value::kStructValue: {
      model::StringMap map;
      for (const auto& [name, item] : value.struct_value().fields()) {
        if (item.kind_case() != google::protobuf::Value::kStringValue) {
          throw std::runtime_error("property '" + key + "' holds a non-string map value");
        }
        map.emplace(name, item.string_value());
      }
      return map;
    }
    default:
      throw std::runtime_error("property '" + key + "' has no representable value");
  }
}

} // namespace

std::string EncodeProperties(const model::PropertyMap& properties) {
  google::protobuf::Struct message;
  auto*                    fields = message.mutable_fields();
  for (const auto& [key, value] : properties) {
    ToValue(value, &(*fields)[key]);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode properties: " + std::string(status.message()));
  }
  return json;
}

model::PropertyMap DecodeProperties(std::string_view json) {
  google::protobuf::Struct message;
  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &message);
  if (!status.ok()) {
    throw std::runtime_error("Failed to decode properties: " + std::string(status.message()));
  }

  model::PropertyMap properties;
  for (const auto& [key, value] : message.fields()) {
    properties.emplace(key, FromValue(key, value));
  }
  return properties;
}

std::string EncodeSnapshot(const std::optional<model::PropertyMap>& snapshot) {
  return snapshot ? EncodeProperties(*snapshot) : std::string();
}

std::optional<model::PropertyMap> DecodeSnapshot(std::string_view json) {
  if (json.empty()) return std::nullopt;
  return DecodeProperties(json);
}

} // namespace codegraph::db::sql
