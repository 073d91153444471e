// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "probe/latency_probe.hpp"

#include "util/errors.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include <asio/io_context.hpp>

namespace cdnscan {
namespace probe {

std::optional<scan::LatencyRecord> PairResult::record() const {
  if (!origin.ok() || !candidate.ok()) {
    return std::nullopt;
  }
  return scan::LatencyRecord{origin.rtt_ms, candidate.rtt_ms};
}

LatencyProbe::LatencyProbe(ProbeSettings settings)
    : settings_(std::move(settings)), ssl_ctx_(asio::ssl::context::tls_client) {
  auto server = ParsedUrl::Parse(settings_.server_url);
  if (!server) {
    throw ConfigError("invalid server_url '" + settings_.server_url + "': expected http(s)://host[:port]/path");
  }
  server_url_ = *server;

  if (!settings_.cdn_url.empty()) {
    cdn_url_ = ParsedUrl::Parse(settings_.cdn_url);
    if (!cdn_url_) {
      throw ConfigError("invalid cdn_url '" + settings_.cdn_url + "': expected http(s)://host[:port]/path");
    }
    if (cdn_url_->host_is_ip()) {
      throw ConfigError("cdn_url '" + settings_.cdn_url + "' must name a host, not an IP address");
    }
  }

  auto listen = util::ParseIPAddress(settings_.listen_ip);
  if (!listen) {
    throw ConfigError("invalid listen_ip '" + settings_.listen_ip + "'");
  }
  listen_address_ = *listen;

  if (settings_.verify_tls) {
    asio::error_code ec;
    ssl_ctx_.set_default_verify_paths(ec);
    if (ec) {
      LOG_PROBE_WARN("cannot load system CA certificates: {}", ec.message());
    }
  }
}

LegRequest LatencyProbe::OriginRequest(std::size_t index) const {
  LegRequest req;
  req.url = server_url_;
  req.expected_body = settings_.server_res_body;
  req.timeout = settings_.max_rtt;
  req.verify_tls = settings_.verify_tls;
  if (settings_.origin_via_tunnel) {
    req.socks5_proxy = asio::ip::tcp::endpoint(listen_address_, static_cast<uint16_t>(settings_.port_base + index));
  }
  return req;
}

LegRequest LatencyProbe::CandidateRequest(const asio::ip::address& candidate) const {
  LegRequest req;
  if (cdn_url_) {
    req.url = *cdn_url_;
  } else {
    req.url.scheme = "http";
    req.url.host = candidate.to_string();
    req.url.port = 80;
    req.url.target = "/";
  }
  req.expected_body = settings_.cdn_res_body;
  req.timeout = settings_.max_rtt;
  req.verify_tls = settings_.verify_tls;
  req.connect_override = candidate;
  return req;
}

std::vector<PairResult> LatencyProbe::RunPairs(const std::vector<asio::ip::address>& batch) {
  std::vector<PairResult> results(batch.size());
  asio::io_context io;

  for (std::size_t i = 0; i < batch.size(); ++i) {
    HttpLeg::Start(io, ssl_ctx_, OriginRequest(i), [&results, i](LegResult r) { results[i].origin = std::move(r); });
    HttpLeg::Start(io, ssl_ctx_, CandidateRequest(batch[i]),
                   [&results, i](LegResult r) { results[i].candidate = std::move(r); });
  }

  // Returns once every leg has finished or timed out
  io.run();

  for (std::size_t i = 0; i < batch.size(); ++i) {
    Report(batch[i], results[i]);
  }
  return results;
}

std::vector<std::optional<scan::LatencyRecord>> LatencyProbe::Run(const std::vector<asio::ip::address>& batch) {
  auto pairs = RunPairs(batch);
  std::vector<std::optional<scan::LatencyRecord>> records;
  records.reserve(pairs.size());
  for (const auto& pair : pairs) {
    records.push_back(pair.record());
  }
  return records;
}

void LatencyProbe::Report(const asio::ip::address& candidate, const PairResult& pair) const {
  if (auto record = pair.record()) {
    LOG_PROBE_DEBUG("{}: server_rtt={}ms cdn_rtt={}ms", candidate.to_string(), record->origin_rtt_ms,
                    record->candidate_rtt_ms);
    return;
  }
  if (settings_.warn_on_body_mismatch) {
    if (pair.origin.status == LegStatus::BodyMismatch) {
      LOG_PROBE_WARN_RL("{}: origin response from {} did not contain '{}' (tunnel may be misrouted)",
                        candidate.to_string(), server_url_.ToString(), settings_.server_res_body);
    }
    if (pair.candidate.status == LegStatus::BodyMismatch) {
      LOG_PROBE_WARN_RL("{}: CDN response did not contain '{}'", candidate.to_string(), settings_.cdn_res_body);
    }
  }
  LOG_PROBE_TRACE("{}: origin {} ({}), candidate {} ({})", candidate.to_string(), LegStatusName(pair.origin.status),
                  pair.origin.detail, LegStatusName(pair.candidate.status), pair.candidate.detail);
}

}  // namespace probe
}  // namespace cdnscan
