// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "probe/url.hpp"

#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"

#include <algorithm>
#include <cctype>

namespace cdnscan {
namespace probe {

namespace {

std::string ToLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
  return out;
}

}  // namespace

std::optional<ParsedUrl> ParsedUrl::Parse(std::string_view url) {
  url = util::TrimWhitespace(url);

  auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos) {
    return std::nullopt;
  }
  ParsedUrl parsed;
  parsed.scheme = ToLower(url.substr(0, scheme_end));
  if (parsed.scheme != "http" && parsed.scheme != "https") {
    return std::nullopt;
  }

  std::string_view rest = url.substr(scheme_end + 3);
  auto authority_end = rest.find_first_of("/?#");
  std::string_view authority = rest.substr(0, authority_end);
  std::string_view tail = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

  if (authority.empty() || authority.find('@') != std::string_view::npos) {
    return std::nullopt;
  }

  std::string_view host;
  std::string_view port_text;
  if (authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return std::nullopt;
    }
    host = authority.substr(1, close - 1);
    std::string_view after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':') {
        return std::nullopt;
      }
      port_text = after.substr(1);
    }
  } else {
    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
      host = authority.substr(0, colon);
      port_text = authority.substr(colon + 1);
    } else {
      host = authority;
    }
  }
  if (host.empty()) {
    return std::nullopt;
  }
  parsed.host = ToLower(host);

  if (!port_text.empty()) {
    auto port = util::SafeParsePort(port_text);
    if (!port) {
      return std::nullopt;
    }
    parsed.port = *port;
  } else {
    parsed.port = parsed.is_https() ? 443 : 80;
  }

  auto fragment = tail.find('#');
  if (fragment != std::string_view::npos) {
    tail = tail.substr(0, fragment);
  }
  if (tail.empty()) {
    parsed.target = "/";
  } else if (tail.front() == '?') {
    parsed.target = "/" + std::string(tail);
  } else {
    parsed.target = std::string(tail);
  }
  return parsed;
}

bool ParsedUrl::host_is_ip() const {
  return util::IsValidIPAddress(host);
}

std::string ParsedUrl::HostHeader() const {
  std::string out = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  if (!has_default_port()) {
    out += ":" + std::to_string(port);
  }
  return out;
}

std::string ParsedUrl::ToString() const {
  return scheme + "://" + HostHeader() + target;
}

}  // namespace probe
}  // namespace cdnscan
