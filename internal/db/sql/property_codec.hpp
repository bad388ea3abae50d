#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/model/property_value.hpp"

namespace codegraph::db::sql {

/*
  PropertyMap <-> JSON text for the SQL backends.

  Goes through google.protobuf.Struct: bool -> bool, int -> number,
  string -> string, list -> list of strings, map -> object of strings.
  The mapping is unambiguous, so Decode(Encode(m)) == m for every map
  the node model produces.

  Both throw std::runtime_error on malformed input.
*/
std::string EncodeProperties(const model::PropertyMap& properties);

model::PropertyMap DecodeProperties(std::string_view json);

// Absent snapshots are stored as SQL NULL / empty text.
std::string EncodeSnapshot(const std::optional<model::PropertyMap>& snapshot);

std::optional<model::PropertyMap> DecodeSnapshot(std::string_view json);

} // namespace codegraph::db::sql
