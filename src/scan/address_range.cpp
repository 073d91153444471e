// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/address_range.hpp"

#include "util/errors.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

namespace cdnscan {
namespace scan {

namespace {

// IPv4 "a.b.c.d/n" or IPv6 "x:x::x/n". The alternatives are tried in order,
// so a dotted quad never reaches the IPv6 branch.
constexpr const char* kRangeTokenPattern =
    R"((\d{1,3}(?:\.\d{1,3}){3}/\d{1,3})|([0-9A-Fa-f]{0,4}(?::[0-9A-Fa-f]{0,4}){2,7}/\d{1,3}))";

asio::ip::address ApplyMask(const asio::ip::address& address, unsigned prefix_length) {
  if (address.is_v4()) {
    uint32_t value = address.to_v4().to_uint();
    uint32_t mask = prefix_length == 0 ? 0 : ~uint32_t{0} << (32 - prefix_length);
    return asio::ip::address_v4(value & mask);
  }

  auto bytes = address.to_v6().to_bytes();
  for (unsigned i = 0; i < bytes.size(); ++i) {
    unsigned bit_start = i * 8;
    if (bit_start >= prefix_length) {
      bytes[i] = 0;
    } else if (prefix_length - bit_start < 8) {
      bytes[i] &= static_cast<uint8_t>(0xff << (8 - (prefix_length - bit_start)));
    }
  }
  return asio::ip::address_v6(bytes);
}

}  // namespace

AddressRange::AddressRange(const asio::ip::address& base, unsigned prefix_length) : prefix_length_(prefix_length) {
  unsigned bits = base.is_v4() ? 32 : 128;
  if (prefix_length > bits) {
    throw std::invalid_argument("prefix length " + std::to_string(prefix_length) + " exceeds " +
                                std::to_string(bits) + " bits for " + base.to_string());
  }
  base_ = ApplyMask(base, prefix_length);
}

std::optional<AddressRange> AddressRange::Parse(std::string_view text) {
  auto slash = text.find('/');
  if (slash == std::string_view::npos || slash == 0) {
    return std::nullopt;
  }

  asio::error_code ec;
  auto base = asio::ip::make_address(std::string(text.substr(0, slash)), ec);
  if (ec) {
    return std::nullopt;
  }

  auto prefix = util::SafeParseUint64(text.substr(slash + 1));
  if (!prefix || *prefix > (base.is_v4() ? 32u : 128u)) {
    return std::nullopt;
  }
  return AddressRange(base, static_cast<unsigned>(*prefix));
}

uint64_t AddressRange::capacity() const {
  unsigned host_bits = address_bits() - prefix_length_;
  if (host_bits >= 64) {
    return std::numeric_limits<uint64_t>::max();
  }
  return uint64_t{1} << host_bits;
}

std::optional<asio::ip::address> AddressRange::GetIp(uint64_t idx) const {
  if (idx >= capacity()) {
    return std::nullopt;
  }

  if (base_.is_v4()) {
    return asio::ip::address_v4(base_.to_v4().to_uint() + static_cast<uint32_t>(idx));
  }

  // 128-bit big-endian add; the host bits of base_ are zero so the
  // addition never carries out of the range.
  auto bytes = base_.to_v6().to_bytes();
  uint64_t carry = idx;
  for (int i = static_cast<int>(bytes.size()) - 1; i >= 0 && carry != 0; --i) {
    uint64_t sum = static_cast<uint64_t>(bytes[i]) + (carry & 0xff);
    bytes[i] = static_cast<uint8_t>(sum & 0xff);
    carry = (carry >> 8) + (sum >> 8);
  }
  return asio::ip::address_v6(bytes);
}

bool AddressRange::Contains(const asio::ip::address& address) const {
  if (address.is_v4() != base_.is_v4()) {
    return false;
  }
  return ApplyMask(address, prefix_length_) == base_;
}

std::string AddressRange::ToString() const {
  return base_.to_string() + "/" + std::to_string(prefix_length_);
}

AddressRangeParser::AddressRangeParser() : token_pattern_(kRangeTokenPattern, std::regex::ECMAScript) {}

std::vector<AddressRange> AddressRangeParser::Parse(const std::string& text) const {
  std::vector<AddressRange> ranges;
  std::set<std::string> seen;
  size_t skipped = 0;

  for (auto it = std::sregex_iterator(text.begin(), text.end(), token_pattern_); it != std::sregex_iterator(); ++it) {
    const std::string token = it->str();
    auto range = AddressRange::Parse(token);
    if (!range) {
      LOG_SCAN_WARN("cannot parse address range \"{}\", skipping", token);
      ++skipped;
      continue;
    }
    if (!seen.insert(range->ToString()).second) {
      continue;
    }
    if (!util::IsRoutable(range->base())) {
      LOG_SCAN_WARN("address range {} is not publicly routable", range->ToString());
    }
    ranges.push_back(std::move(*range));
  }

  LOG_SCAN_DEBUG("parsed {} address ranges ({} malformed tokens skipped)", ranges.size(), skipped);
  return ranges;
}

std::vector<AddressRange> AddressRangeParser::LoadFile(const std::filesystem::path& path) const {
  auto text = util::read_file_string(path);
  if (!text) {
    throw StateError("cannot read address source " + path.string());
  }
  return Parse(*text);
}

uint64_t ComputeMaxOffset(const std::vector<AddressRange>& ranges, uint64_t configured_cap) {
  uint64_t largest = 0;
  for (const auto& range : ranges) {
    largest = std::max(largest, range.capacity());
  }
  return std::min(largest, configured_cap);
}

std::size_t EnableRangesContaining(std::vector<AddressRange>& ranges, const std::vector<asio::ip::address>& addresses) {
  // (is_v4, prefix) -> masked base -> indices of ranges with that identity
  std::map<std::pair<bool, unsigned>, std::map<asio::ip::address, std::vector<std::size_t>>> index;
  for (std::size_t i = 0; i < ranges.size(); ++i) {
    index[{ranges[i].base().is_v4(), ranges[i].prefix_length()}][ranges[i].base()].push_back(i);
  }

  std::size_t newly_enabled = 0;
  for (const auto& address : addresses) {
    for (auto& [key, bases] : index) {
      if (key.first != address.is_v4()) {
        continue;
      }
      auto it = bases.find(ApplyMask(address, key.second));
      if (it == bases.end()) {
        continue;
      }
      for (std::size_t idx : it->second) {
        if (!ranges[idx].enabled()) {
          ranges[idx].Enable();
          ++newly_enabled;
        }
      }
    }
  }
  return newly_enabled;
}

}  // namespace scan
}  // namespace cdnscan
