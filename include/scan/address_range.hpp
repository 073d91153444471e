// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 AddressRange - one contiguous block of candidate addresses (CIDR)

 Purpose
 - Turn free-form text (scraped prefix lists, BGP dumps, hand-edited files)
   into an ordered, duplicate-free list of ranges
 - Map an ordinal offset inside a range to a concrete address

 Enumeration order across ranges lives in ScanCursor; this file only
 knows about single ranges.
*/

#include <cstdint>
#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <asio/ip/address.hpp>

namespace cdnscan {
namespace scan {

class AddressRange {
public:
  // Host bits of base are cleared. Throws std::invalid_argument if
  // prefix_length exceeds the family's address width.
  AddressRange(const asio::ip::address& base, unsigned prefix_length);

  // Parse "<address>/<prefix>". Returns std::nullopt on any syntax error,
  // bad address or out-of-range prefix.
  static std::optional<AddressRange> Parse(std::string_view text);

  const asio::ip::address& base() const { return base_; }
  unsigned prefix_length() const { return prefix_length_; }
  unsigned address_bits() const { return base_.is_v4() ? 32 : 128; }

  // Number of addresses in the range, saturated at UINT64_MAX for very
  // short IPv6 prefixes.
  uint64_t capacity() const;

  // base + idx, or std::nullopt if idx >= capacity().
  std::optional<asio::ip::address> GetIp(uint64_t idx) const;

  bool Contains(const asio::ip::address& address) const;

  // A range is enabled once any probe against it has succeeded. The flag
  // never goes back to false.
  bool enabled() const { return enabled_; }
  void Enable() { enabled_ = true; }

  std::string ToString() const;

  // Identity is base + prefix; the enabled flag is runtime state.
  bool operator==(const AddressRange& other) const {
    return prefix_length_ == other.prefix_length_ && base_ == other.base_;
  }

private:
  asio::ip::address base_;
  unsigned prefix_length_;
  bool enabled_{false};
};

/**
 * Extracts every "<address>/<prefix>" token from free-form text.
 *
 * The matcher is compiled once per parser instance; construct one at
 * startup and reuse it.
 */
class AddressRangeParser {
public:
  AddressRangeParser();

  // Malformed tokens are logged and skipped. Duplicates (same base and
  // prefix after masking) collapse to their first appearance, so the
  // result order is stable for a given input.
  std::vector<AddressRange> Parse(const std::string& text) const;

  // Parse the contents of a file. Throws StateError if it cannot be read.
  std::vector<AddressRange> LoadFile(const std::filesystem::path& path) const;

private:
  std::regex token_pattern_;
};

// Global per-range offset ceiling: min(largest capacity, configured cap).
uint64_t ComputeMaxOffset(const std::vector<AddressRange>& ranges, uint64_t configured_cap);

// Enable every range that contains at least one of the given addresses.
// Returns the number of ranges newly enabled.
std::size_t EnableRangesContaining(std::vector<AddressRange>& ranges, const std::vector<asio::ip::address>& addresses);

}  // namespace scan
}  // namespace cdnscan
