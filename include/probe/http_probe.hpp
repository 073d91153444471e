// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 HttpLeg - one timed HTTP(S) GET

 Connection target is one of:
 - a SOCKS5 proxy (the tunnel's local listener for this batch member); the
   proxy is asked to connect to the URL's host and port
 - a fixed address (the candidate), keeping the URL's host for the Host
   header and TLS SNI
 - the URL's host, resolved normally

 The round-trip time runs from Start() until the full body has arrived.
 A leg that does not finish within its timeout is aborted. Failures are
 reported as a LegStatus, never thrown.

 Runs entirely on the io_context passed to Start(); not thread-safe.
*/

#include "probe/url.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/ssl.hpp>
#include <asio/steady_timer.hpp>

namespace cdnscan {
namespace probe {

enum class LegStatus {
  Ok,
  NetworkError,  // resolve/connect/proxy/TLS/read failure or bad response
  Timeout,       // did not complete within the leg timeout
  BodyMismatch,  // response arrived but lacks the expected text
};

const char* LegStatusName(LegStatus status);

struct LegResult {
  LegStatus status{LegStatus::NetworkError};
  uint64_t rtt_ms{0};
  std::string detail;  // failure description, empty on success

  bool ok() const { return status == LegStatus::Ok; }
};

struct LegRequest {
  ParsedUrl url;
  std::string expected_body;
  std::chrono::milliseconds timeout{1000};
  bool verify_tls{true};
  std::optional<asio::ip::tcp::endpoint> socks5_proxy;
  std::optional<asio::ip::address> connect_override;
};

// Largest response accepted (headers + body).
constexpr std::size_t MAX_RESPONSE_SIZE = 1024 * 1024;

enum class HttpParseState { Incomplete, Complete, Invalid };

// Parse a raw HTTP/1.x response. Complete once the body is known to be
// whole: Content-Length satisfied, terminal chunk seen, or (for
// close-delimited bodies) eof. body receives the decoded body.
HttpParseState ParseHttpResponse(const std::string& raw, bool eof, std::string& body);

// Build a SOCKS5 CONNECT request for host:port (address type chosen from
// host: IPv4, IPv6 or domain name). Domain names longer than 255 bytes
// are rejected with std::nullopt.
std::optional<std::string> BuildSocks5Connect(const std::string& host, uint16_t port);

class HttpLeg : public std::enable_shared_from_this<HttpLeg> {
public:
  using Callback = std::function<void(LegResult)>;

  // Start the leg on io. callback runs exactly once, on io.
  static void Start(asio::io_context& io, asio::ssl::context& ssl_ctx, LegRequest request, Callback callback);

private:
  HttpLeg(asio::io_context& io, asio::ssl::context& ssl_ctx, LegRequest request, Callback callback);

  void Begin();
  void Resolve();
  void Connect(const asio::ip::tcp::endpoint& endpoint);
  void OnConnected();
  void SocksGreeting();
  void SocksConnect();
  void SocksReadReply();
  void Handshake();
  void SendRequest();
  void ReadResponse();
  void OnRead(const asio::error_code& ec, std::size_t n);
  void Finish(LegStatus status, std::string detail);

  asio::ip::tcp::socket& socket() { return stream_.next_layer(); }

  LegRequest request_;
  Callback callback_;
  asio::ip::tcp::resolver resolver_;
  asio::ssl::stream<asio::ip::tcp::socket> stream_;
  asio::steady_timer timer_;
  std::chrono::steady_clock::time_point started_;
  bool done_{false};
  bool tls_{false};

  std::string out_;
  std::string response_;
  std::array<char, 8192> buffer_{};
};

}  // namespace probe
}  // namespace cdnscan
