// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 LatencyProbe - paired origin/candidate measurement for one batch

 For batch member i two legs run concurrently:
 - origin leg: GET server_url through the tunnel listener
   listen_ip:port_base+i (SOCKS5), or directly if origin_via_tunnel is off
 - candidate leg: GET cdn_url with the connection forced to the
   candidate address (Host/SNI keep the URL's host name); an empty
   cdn_url means http://<candidate>/

 Every leg of every member shares one io_context and runs concurrently;
 Run() returns once all of them have completed or timed out.
*/

#include "probe/http_probe.hpp"
#include "probe/url.hpp"
#include "scan/result_store.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <asio/ip/address.hpp>
#include <asio/ssl/context.hpp>

namespace cdnscan {
namespace probe {

struct ProbeSettings {
  std::string server_url;
  std::string cdn_url;  // may be empty
  std::string server_res_body;
  std::string cdn_res_body;
  std::string listen_ip{"127.0.0.1"};
  uint16_t port_base{10000};
  std::chrono::milliseconds max_rtt{1000};
  bool origin_via_tunnel{true};
  bool verify_tls{true};
  bool warn_on_body_mismatch{true};
};

// Outcome of both legs for one batch member.
struct PairResult {
  LegResult origin;
  LegResult candidate;

  std::optional<scan::LatencyRecord> record() const;
};

class LatencyProbe {
public:
  // Throws ConfigError if a URL or listen_ip cannot be used.
  explicit LatencyProbe(ProbeSettings settings);

  // One entry per batch member, in batch order.
  std::vector<PairResult> RunPairs(const std::vector<asio::ip::address>& batch);

  // RunPairs() reduced to records: std::nullopt where either leg failed.
  std::vector<std::optional<scan::LatencyRecord>> Run(const std::vector<asio::ip::address>& batch);

  const ProbeSettings& settings() const { return settings_; }

private:
  LegRequest OriginRequest(std::size_t index) const;
  LegRequest CandidateRequest(const asio::ip::address& candidate) const;
  void Report(const asio::ip::address& candidate, const PairResult& pair) const;

  ProbeSettings settings_;
  ParsedUrl server_url_;
  std::optional<ParsedUrl> cdn_url_;
  asio::ip::address listen_address_;
  asio::ssl::context ssl_ctx_;
};

}  // namespace probe
}  // namespace cdnscan
