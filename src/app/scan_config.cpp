// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/scan_config.hpp"

#include "probe/url.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "util/netaddress.hpp"

#include <limits>

namespace cdnscan {
namespace app {

namespace {

const nlohmann::json& Require(const nlohmann::json& j, const char* key, const std::string& source) {
  auto it = j.find(key);
  if (it == j.end()) {
    throw ConfigError(source + ": missing required key '" + key + "'");
  }
  return *it;
}

uint64_t ReadUnsigned(const nlohmann::json& value, const char* key, const std::string& source) {
  if (!value.is_number_unsigned()) {
    throw ConfigError(source + ": '" + key + "' must be a non-negative integer, got " + value.dump());
  }
  return value.get<uint64_t>();
}

std::string ReadString(const nlohmann::json& value, const char* key, const std::string& source) {
  if (!value.is_string()) {
    throw ConfigError(source + ": '" + key + "' must be a string, got " + value.dump());
  }
  return value.get<std::string>();
}

bool ReadBool(const nlohmann::json& value, const char* key, const std::string& source) {
  if (!value.is_boolean()) {
    throw ConfigError(source + ": '" + key + "' must be true or false, got " + value.dump());
  }
  return value.get<bool>();
}

}  // namespace

ScanConfig ScanConfig::FromJson(const nlohmann::json& j, const std::string& source) {
  if (!j.is_object()) {
    throw ConfigError(source + ": configuration must be a JSON object");
  }

  ScanConfig config;
  uint64_t port_base = ReadUnsigned(Require(j, "port_base", source), "port_base", source);
  if (port_base == 0 || port_base > std::numeric_limits<uint16_t>::max()) {
    throw ConfigError(source + ": 'port_base' must be between 1 and 65535, got " + std::to_string(port_base));
  }
  config.port_base = static_cast<uint16_t>(port_base);
  config.max_connection_count = static_cast<std::size_t>(
      ReadUnsigned(Require(j, "max_connection_count", source), "max_connection_count", source));
  config.server_url = ReadString(Require(j, "server_url", source), "server_url", source);
  config.cdn_url = ReadString(Require(j, "cdn_url", source), "cdn_url", source);
  config.listen_ip = ReadString(Require(j, "listen_ip", source), "listen_ip", source);
  config.max_rtt = ReadUnsigned(Require(j, "max_rtt", source), "max_rtt", source);
  config.server_res_body = ReadString(Require(j, "server_res_body", source), "server_res_body", source);
  config.cdn_res_body = ReadString(Require(j, "cdn_res_body", source), "cdn_res_body", source);
  config.max_subnet_len = ReadUnsigned(Require(j, "max_subnet_len", source), "max_subnet_len", source);

  if (auto it = j.find("tunnel_binary"); it != j.end()) {
    config.tunnel_binary = ReadString(*it, "tunnel_binary", source);
  }
  if (auto it = j.find("tunnel_startup_timeout_ms"); it != j.end()) {
    config.tunnel_startup_timeout_ms = ReadUnsigned(*it, "tunnel_startup_timeout_ms", source);
  }
  if (auto it = j.find("origin_via_tunnel"); it != j.end()) {
    config.origin_via_tunnel = ReadBool(*it, "origin_via_tunnel", source);
  }
  if (auto it = j.find("verify_tls"); it != j.end()) {
    config.verify_tls = ReadBool(*it, "verify_tls", source);
  }

  config.Validate(source);
  return config;
}

ScanConfig ScanConfig::LoadFromFile(const std::filesystem::path& path) {
  auto text = util::read_file_string(path);
  if (!text) {
    throw ConfigError("cannot read configuration file " + path.string());
  }
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(*text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(path.string() + ": invalid JSON: " + e.what());
  }
  return FromJson(j, path.string());
}

void ScanConfig::Validate(const std::string& source) const {
  if (max_connection_count == 0) {
    throw ConfigError(source + ": 'max_connection_count' must be positive");
  }
  if (static_cast<uint64_t>(port_base) + max_connection_count - 1 > std::numeric_limits<uint16_t>::max()) {
    throw ConfigError(source + ": port_base " + std::to_string(port_base) + " + max_connection_count " +
                      std::to_string(max_connection_count) + " exceeds port 65535");
  }
  if (max_rtt == 0) {
    throw ConfigError(source + ": 'max_rtt' must be positive");
  }
  if (max_subnet_len == 0) {
    throw ConfigError(source + ": 'max_subnet_len' must be positive");
  }
  if (tunnel_binary.empty()) {
    throw ConfigError(source + ": 'tunnel_binary' must not be empty");
  }
  if (!probe::ParsedUrl::Parse(server_url)) {
    throw ConfigError(source + ": 'server_url' must be an http or https URL, got '" + server_url + "'");
  }
  if (!cdn_url.empty()) {
    auto url = probe::ParsedUrl::Parse(cdn_url);
    if (!url) {
      throw ConfigError(source + ": 'cdn_url' must be an http or https URL, got '" + cdn_url + "'");
    }
    if (url->host_is_ip()) {
      throw ConfigError(source + ": 'cdn_url' must name a host, not an IP address: '" + cdn_url + "'");
    }
  }
  if (!util::IsValidIPAddress(listen_ip)) {
    throw ConfigError(source + ": 'listen_ip' must be a numeric IP address, got '" + listen_ip + "'");
  }
}

}  // namespace app
}  // namespace cdnscan
