// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace cdnscan {
namespace app {

/**
 * Scanner configuration (ip-tester.json in the data directory).
 *
 * Required: port_base, max_connection_count, server_url, cdn_url,
 * listen_ip, max_rtt, server_res_body, cdn_res_body, max_subnet_len.
 * Unknown keys are ignored.
 */
struct ScanConfig {
  uint16_t port_base{0};
  std::size_t max_connection_count{0};
  std::string server_url;
  std::string cdn_url;  // empty: probe http://<candidate>/
  std::string listen_ip;
  uint64_t max_rtt{0};  // ms, per probe leg
  std::string server_res_body;
  std::string cdn_res_body;
  uint64_t max_subnet_len{0};  // per-range offset ceiling

  std::string tunnel_binary{"./sing-box"};
  uint64_t tunnel_startup_timeout_ms{5000};
  bool origin_via_tunnel{true};
  bool verify_tls{true};

  // Throws ConfigError naming source and the offending key.
  static ScanConfig FromJson(const nlohmann::json& j, const std::string& source = "<config>");
  static ScanConfig LoadFromFile(const std::filesystem::path& path);

  // Cross-field checks (port range, URL shapes, listen address).
  void Validate(const std::string& source) const;
};

}  // namespace app
}  // namespace cdnscan
