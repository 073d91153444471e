// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"

#include <charconv>
#include <limits>

namespace cdnscan {
namespace util {

std::optional<uint64_t> SafeParseUint64(std::string_view str) {
  if (str.empty() || str.size() > 20) {
    return std::nullopt;
  }
  for (char c : str) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }

  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (ec != std::errc() || ptr != str.data() + str.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<uint16_t> SafeParsePort(std::string_view str) {
  auto value = SafeParseUint64(str);
  if (!value || *value == 0 || *value > std::numeric_limits<uint16_t>::max()) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<std::size_t> SafeParseSize(std::string_view str) {
  auto value = SafeParseUint64(str);
  if (!value || *value > std::numeric_limits<std::size_t>::max()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(*value);
}

std::string_view TrimWhitespace(std::string_view str) {
  constexpr std::string_view kSpace = " \t\r\n\f\v";
  auto begin = str.find_first_not_of(kSpace);
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = str.find_last_not_of(kSpace);
  return str.substr(begin, end - begin + 1);
}

}  // namespace util
}  // namespace cdnscan
