#include "internal/db/sql/property_codec.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using namespace codegraph::db::sql;
namespace model = codegraph::model;

bool Throws(const std::string& json) {
  try {
    DecodeProperties(json);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestEveryValueShapeSurvives() {
  model::PropertyMap properties;
  properties["is_interface"] = true;
  properties["line_start"]   = std::int64_t{120};
  properties["name"]         = std::string("UserService");
  properties["modifiers"]    = model::StringList{"public", "final"};
  properties["attributes"]   = model::StringMap{{"value", "users"}, {"schema", "auth"}};

  auto decoded = DecodeProperties(EncodeProperties(properties));
  assert(decoded == properties);
  assert(std::get<std::int64_t>(decoded.at("line_start")) == 120);
  assert(std::get<model::StringList>(decoded.at("modifiers")).front() == "public");
}

void TestEmptyMap() {
  auto json = EncodeProperties({});
  assert(json == "{}");
  assert(DecodeProperties(json).empty());
}

void TestSnapshotAbsence() {
  assert(EncodeSnapshot(std::nullopt).empty());
  assert(!DecodeSnapshot("").has_value());

  model::PropertyMap properties{{"name", std::string("Order")}};
  auto               snapshot = DecodeSnapshot(EncodeSnapshot(properties));
  assert(snapshot.has_value());
  assert(*snapshot == properties);
}

void TestMalformedInputThrows() {
  assert(Throws("{\"name\":"));
  assert(Throws("[1,2,3]"));
  assert(Throws("{\"name\":null}"));
  assert(Throws("{\"modifiers\":[\"public\",1]}"));
  assert(Throws("{\"attributes\":{\"value\":true}}"));
}

} // namespace

int main() {
  TestEveryValueShapeSurvives();
  TestEmptyMap();
  TestSnapshotAbsence();
  TestMalformedInputThrows();

  std::cout << "codegraph_unit_property_codec: pass\n";
  return 0;
}
