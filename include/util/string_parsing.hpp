// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace cdnscan {
namespace util {

// Strict unsigned decimal parsing: digits only, no sign, no whitespace,
// no trailing characters, no overflow.
std::optional<uint64_t> SafeParseUint64(std::string_view str);

// Strict port parsing (1-65535).
std::optional<uint16_t> SafeParsePort(std::string_view str);

// Strict size_t parsing (same rules as SafeParseUint64).
std::optional<std::size_t> SafeParseSize(std::string_view str);

// Strip leading and trailing ASCII whitespace.
std::string_view TrimWhitespace(std::string_view str);

}  // namespace util
}  // namespace cdnscan
