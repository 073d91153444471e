// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize numeric IP address strings (config values,
   persisted result lines)
 - Classify addresses as routable or reserved (range sanity warnings)
*/

#include <cstdint>
#include <optional>
#include <string>

#include <asio/ip/address.hpp>

namespace cdnscan {
namespace util {

/**
 * Parse a numeric IP address (IPv4 or IPv6).
 *
 * IPv4-mapped IPv6 addresses are normalized to IPv4 so that
 * "::ffff:1.2.3.4" and "1.2.3.4" name the same result-store key.
 * Hostnames are rejected.
 *
 * @return parsed address, or std::nullopt if invalid
 */
std::optional<asio::ip::address> ParseIPAddress(const std::string& address);

bool IsValidIPAddress(const std::string& address);

// True if the address is routable on the public internet (not private,
// loopback, link-local, documentation, multicast or otherwise reserved).
bool IsRoutable(const asio::ip::address& address);

// Byte-based helpers
bool IsIPv4Routable(uint8_t b0, uint8_t b1, uint8_t b2, uint8_t b3) noexcept;
bool IsIPv6Routable(const uint8_t* bytes) noexcept;

}  // namespace util
}  // namespace cdnscan
