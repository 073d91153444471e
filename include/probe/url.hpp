// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cdnscan {
namespace probe {

// Minimal http/https URL: enough to build a GET request and pick a
// connect target. User info is rejected, fragments are dropped.
struct ParsedUrl {
  std::string scheme;  // "http" or "https", lower case
  std::string host;    // lower case, without IPv6 brackets
  uint16_t port{0};    // explicit or scheme default
  std::string target;  // path + query, at least "/"

  // Returns std::nullopt for unsupported schemes, empty hosts and bad ports.
  static std::optional<ParsedUrl> Parse(std::string_view url);

  bool is_https() const { return scheme == "https"; }
  bool has_default_port() const { return port == (is_https() ? 443 : 80); }

  // True if host is a numeric IPv4 or IPv6 address.
  bool host_is_ip() const;

  // Value for the Host header: brackets IPv6 literals, appends a
  // non-default port.
  std::string HostHeader() const;

  std::string ToString() const;
};

}  // namespace probe
}  // namespace cdnscan
