#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace codegraph::util {

// Lowercase hex of the first `prefix_bytes` bytes of MD5(input).
std::string Md5HexPrefix(std::string_view input, std::size_t prefix_bytes = 4);

std::string ToHex(const unsigned char* data, std::size_t size);

} // namespace codegraph::util
