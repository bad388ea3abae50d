#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace codegraph::util {

std::string Trim(std::string_view s);
std::string ToLower(std::string_view s);
std::string Join(const std::vector<std::string>& parts, std::string_view separator);

// Splits on every occurrence of `sep`, keeping empty pieces.
std::vector<std::string> Split(std::string_view s, char sep);

} // namespace codegraph::util
