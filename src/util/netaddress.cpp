// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/netaddress.hpp"

#include "util/logging.hpp"

namespace cdnscan {
namespace util {

bool IsIPv4Routable(uint8_t b0, uint8_t b1, uint8_t b2, uint8_t b3) noexcept {
  // 0.0.0.0/8 - "This network" (RFC 1122)
  if (b0 == 0)
    return false;

  // 10.0.0.0/8 - Private (RFC 1918)
  if (b0 == 10)
    return false;

  // 100.64.0.0/10 - Shared CGNAT (RFC 6598)
  if (b0 == 100 && (b1 >= 64 && b1 <= 127))
    return false;

  // 127.0.0.0/8 - Loopback (RFC 1122)
  if (b0 == 127)
    return false;

  // 169.254.0.0/16 - Link-local (RFC 3927)
  if (b0 == 169 && b1 == 254)
    return false;

  // 172.16.0.0/12 - Private (RFC 1918)
  if (b0 == 172 && (b1 >= 16 && b1 <= 31))
    return false;

  // 192.0.0.0/24 - IETF Protocol Assignments (RFC 6890)
  if (b0 == 192 && b1 == 0 && b2 == 0)
    return false;

  // 192.0.2.0/24 - Documentation TEST-NET-1 (RFC 5737)
  if (b0 == 192 && b1 == 0 && b2 == 2)
    return false;

  // 192.168.0.0/16 - Private (RFC 1918)
  if (b0 == 192 && b1 == 168)
    return false;

  // 198.18.0.0/15 - Benchmarking (RFC 2544)
  if (b0 == 198 && (b1 == 18 || b1 == 19))
    return false;

  // 198.51.100.0/24 - Documentation TEST-NET-2 (RFC 5737)
  if (b0 == 198 && b1 == 51 && b2 == 100)
    return false;

  // 203.0.113.0/24 - Documentation TEST-NET-3 (RFC 5737)
  if (b0 == 203 && b1 == 0 && b2 == 113)
    return false;

  // 224.0.0.0/4 - Multicast, 240.0.0.0/4 - Reserved
  if (b0 >= 224)
    return false;

  (void)b3;
  return true;
}

bool IsIPv6Routable(const uint8_t* bytes) noexcept {
  bool all_zero = true;
  for (int i = 0; i < 16; i++) {
    if (bytes[i] != 0) {
      all_zero = false;
      break;
    }
  }
  // :: and ::1
  if (all_zero)
    return false;
  bool loopback = bytes[15] == 1;
  for (int i = 0; i < 15 && loopback; i++) {
    loopback = bytes[i] == 0;
  }
  if (loopback)
    return false;

  // fe80::/10 - Link-local (RFC 4291)
  if (bytes[0] == 0xfe && (bytes[1] & 0xc0) == 0x80)
    return false;

  // fc00::/7 - Unique local (RFC 4193)
  if ((bytes[0] & 0xfe) == 0xfc)
    return false;

  // ff00::/8 - Multicast (RFC 4291)
  if (bytes[0] == 0xff)
    return false;

  // 2001:db8::/32 - Documentation (RFC 3849)
  if (bytes[0] == 0x20 && bytes[1] == 0x01 && bytes[2] == 0x0d && bytes[3] == 0xb8)
    return false;

  return true;
}

std::optional<asio::ip::address> ParseIPAddress(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  asio::error_code ec;
  auto ip = asio::ip::make_address(address, ec);
  if (ec) {
    LOG_TRACE("ParseIPAddress: rejecting '{}': {}", address, ec.message());
    return std::nullopt;
  }

  if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
    return asio::ip::address(asio::ip::make_address_v4(asio::ip::v4_mapped, ip.to_v6()));
  }
  return ip;
}

bool IsValidIPAddress(const std::string& address) {
  return ParseIPAddress(address).has_value();
}

bool IsRoutable(const asio::ip::address& address) {
  if (address.is_v4()) {
    auto b = address.to_v4().to_bytes();
    return IsIPv4Routable(b[0], b[1], b[2], b[3]);
  }
  auto b = address.to_v6().to_bytes();
  return IsIPv6Routable(b.data());
}

}  // namespace util
}  // namespace cdnscan
