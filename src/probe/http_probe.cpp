// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "probe/http_probe.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string_view>

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

namespace cdnscan {
namespace probe {

namespace {

constexpr uint8_t kSocksVersion = 0x05;
constexpr uint8_t kSocksNoAuth = 0x00;
constexpr uint8_t kSocksCmdConnect = 0x01;
constexpr uint8_t kSocksAtypIPv4 = 0x01;
constexpr uint8_t kSocksAtypDomain = 0x03;
constexpr uint8_t kSocksAtypIPv6 = 0x04;

std::string ToLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
  return out;
}

bool IsEof(const asio::error_code& ec) {
  // Servers commonly close TLS connections without close_notify
  return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

HttpParseState DecodeChunked(const std::string& raw, std::size_t pos, std::string& body) {
  body.clear();
  while (true) {
    auto line_end = raw.find("\r\n", pos);
    if (line_end == std::string::npos) {
      return HttpParseState::Incomplete;
    }
    std::string_view size_line(raw.data() + pos, line_end - pos);
    auto ext = size_line.find(';');
    if (ext != std::string_view::npos) {
      size_line = size_line.substr(0, ext);
    }
    size_line = util::TrimWhitespace(size_line);
    uint64_t chunk_size = 0;
    auto [ptr, ec] = std::from_chars(size_line.data(), size_line.data() + size_line.size(), chunk_size, 16);
    if (size_line.empty() || ec != std::errc() || ptr != size_line.data() + size_line.size()) {
      return HttpParseState::Invalid;
    }
    pos = line_end + 2;
    if (chunk_size == 0) {
      // Trailers are not inspected
      return HttpParseState::Complete;
    }
    if (chunk_size > MAX_RESPONSE_SIZE) {
      return HttpParseState::Invalid;
    }
    if (raw.size() < pos + chunk_size + 2) {
      return HttpParseState::Incomplete;
    }
    body.append(raw, pos, chunk_size);
    if (raw.compare(pos + chunk_size, 2, "\r\n") != 0) {
      return HttpParseState::Invalid;
    }
    pos += chunk_size + 2;
  }
}

}  // namespace

const char* LegStatusName(LegStatus status) {
  switch (status) {
    case LegStatus::Ok:
      return "ok";
    case LegStatus::NetworkError:
      return "network error";
    case LegStatus::Timeout:
      return "timeout";
    case LegStatus::BodyMismatch:
      return "body mismatch";
  }
  return "unknown";
}

HttpParseState ParseHttpResponse(const std::string& raw, bool eof, std::string& body) {
  auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return HttpParseState::Incomplete;
  }
  if (raw.compare(0, 5, "HTTP/") != 0) {
    return HttpParseState::Invalid;
  }

  std::optional<uint64_t> content_length;
  bool chunked = false;
  std::size_t line_start = raw.find("\r\n") + 2;  // skip status line
  while (line_start < header_end) {
    auto line_end = raw.find("\r\n", line_start);
    std::string_view line(raw.data() + line_start, line_end - line_start);
    line_start = line_end + 2;
    auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      return HttpParseState::Invalid;
    }
    std::string name = ToLower(util::TrimWhitespace(line.substr(0, colon)));
    std::string_view value = util::TrimWhitespace(line.substr(colon + 1));
    if (name == "content-length") {
      content_length = util::SafeParseUint64(value);
      if (!content_length) {
        return HttpParseState::Invalid;
      }
    } else if (name == "transfer-encoding") {
      chunked = ToLower(value).find("chunked") != std::string::npos;
    }
  }

  std::size_t body_start = header_end + 4;
  if (chunked) {
    return DecodeChunked(raw, body_start, body);
  }
  if (content_length) {
    if (raw.size() - body_start < *content_length) {
      return HttpParseState::Incomplete;
    }
    body = raw.substr(body_start, *content_length);
    return HttpParseState::Complete;
  }
  body = raw.substr(body_start);
  return eof ? HttpParseState::Complete : HttpParseState::Incomplete;
}

std::optional<std::string> BuildSocks5Connect(const std::string& host, uint16_t port) {
  std::string req;
  req.push_back(static_cast<char>(kSocksVersion));
  req.push_back(static_cast<char>(kSocksCmdConnect));
  req.push_back(0x00);  // reserved

  asio::error_code ec;
  auto addr = asio::ip::make_address(host, ec);
  if (!ec && addr.is_v4()) {
    req.push_back(static_cast<char>(kSocksAtypIPv4));
    auto bytes = addr.to_v4().to_bytes();
    req.append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
  } else if (!ec && addr.is_v6()) {
    req.push_back(static_cast<char>(kSocksAtypIPv6));
    auto bytes = addr.to_v6().to_bytes();
    req.append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
  } else {
    if (host.empty() || host.size() > 255) {
      return std::nullopt;
    }
    req.push_back(static_cast<char>(kSocksAtypDomain));
    req.push_back(static_cast<char>(host.size()));
    req += host;
  }
  req.push_back(static_cast<char>(port >> 8));
  req.push_back(static_cast<char>(port & 0xff));
  return req;
}

// ============================================================================
// HttpLeg
// ============================================================================

void HttpLeg::Start(asio::io_context& io, asio::ssl::context& ssl_ctx, LegRequest request, Callback callback) {
  auto leg = std::shared_ptr<HttpLeg>(new HttpLeg(io, ssl_ctx, std::move(request), std::move(callback)));
  leg->Begin();
}

HttpLeg::HttpLeg(asio::io_context& io, asio::ssl::context& ssl_ctx, LegRequest request, Callback callback)
    : request_(std::move(request)),
      callback_(std::move(callback)),
      resolver_(io),
      stream_(io, ssl_ctx),
      timer_(io) {}

void HttpLeg::Begin() {
  started_ = std::chrono::steady_clock::now();
  tls_ = request_.url.is_https();

  timer_.expires_after(request_.timeout);
  timer_.async_wait([this, self = shared_from_this()](const asio::error_code& ec) {
    if (ec == asio::error::operation_aborted || done_)
      return;
    Finish(LegStatus::Timeout, "no complete response within " + std::to_string(request_.timeout.count()) + "ms");
  });

  if (tls_) {
    const std::string& host = request_.url.host;
    if (!request_.url.host_is_ip() && SSL_set_tlsext_host_name(stream_.native_handle(), host.c_str()) != 1) {
      Finish(LegStatus::NetworkError, "cannot set TLS server name " + host);
      return;
    }
    if (request_.verify_tls) {
      stream_.set_verify_mode(asio::ssl::verify_peer);
      stream_.set_verify_callback(asio::ssl::host_name_verification(host));
    } else {
      stream_.set_verify_mode(asio::ssl::verify_none);
    }
  }

  if (request_.socks5_proxy) {
    Connect(*request_.socks5_proxy);
  } else if (request_.connect_override) {
    Connect(asio::ip::tcp::endpoint(*request_.connect_override, request_.url.port));
  } else {
    Resolve();
  }
}

void HttpLeg::Resolve() {
  resolver_.async_resolve(
      request_.url.host, std::to_string(request_.url.port),
      [this, self = shared_from_this()](const asio::error_code& ec,
                                        asio::ip::tcp::resolver::results_type results) {
        if (done_)
          return;
        if (ec) {
          Finish(LegStatus::NetworkError, "resolve " + request_.url.host + ": " + ec.message());
          return;
        }
        asio::async_connect(socket(), results,
                            [this, self](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
                              if (done_)
                                return;
                              if (ec) {
                                Finish(LegStatus::NetworkError,
                                       "connect " + request_.url.host + ": " + ec.message());
                                return;
                              }
                              OnConnected();
                            });
      });
}

void HttpLeg::Connect(const asio::ip::tcp::endpoint& endpoint) {
  socket().async_connect(endpoint, [this, self = shared_from_this(), endpoint](const asio::error_code& ec) {
    if (done_)
      return;
    if (ec) {
      Finish(LegStatus::NetworkError,
             "connect " + endpoint.address().to_string() + ":" + std::to_string(endpoint.port()) + ": " +
                 ec.message());
      return;
    }
    OnConnected();
  });
}

void HttpLeg::OnConnected() {
  asio::error_code ignored;
  socket().set_option(asio::ip::tcp::no_delay(true), ignored);

  if (request_.socks5_proxy) {
    SocksGreeting();
  } else if (tls_) {
    Handshake();
  } else {
    SendRequest();
  }
}

void HttpLeg::SocksGreeting() {
  out_.assign({static_cast<char>(kSocksVersion), 0x01, static_cast<char>(kSocksNoAuth)});
  asio::async_write(socket(), asio::buffer(out_), [this, self = shared_from_this()](const asio::error_code& ec, std::size_t) {
    if (done_)
      return;
    if (ec) {
      Finish(LegStatus::NetworkError, "socks5 greeting: " + ec.message());
      return;
    }
    asio::async_read(socket(), asio::buffer(buffer_.data(), 2), [this, self](const asio::error_code& ec, std::size_t) {
      if (done_)
        return;
      if (ec) {
        Finish(LegStatus::NetworkError, "socks5 greeting reply: " + ec.message());
        return;
      }
      if (static_cast<uint8_t>(buffer_[0]) != kSocksVersion || static_cast<uint8_t>(buffer_[1]) != kSocksNoAuth) {
        Finish(LegStatus::NetworkError, "socks5 proxy rejected no-auth method");
        return;
      }
      SocksConnect();
    });
  });
}

void HttpLeg::SocksConnect() {
  auto req = BuildSocks5Connect(request_.url.host, request_.url.port);
  if (!req) {
    Finish(LegStatus::NetworkError, "socks5: host name too long: " + request_.url.host);
    return;
  }
  out_ = std::move(*req);
  asio::async_write(socket(), asio::buffer(out_), [this, self = shared_from_this()](const asio::error_code& ec, std::size_t) {
    if (done_)
      return;
    if (ec) {
      Finish(LegStatus::NetworkError, "socks5 connect request: " + ec.message());
      return;
    }
    SocksReadReply();
  });
}

void HttpLeg::SocksReadReply() {
  // VER REP RSV ATYP + first byte of BND.ADDR
  asio::async_read(socket(), asio::buffer(buffer_.data(), 5), [this, self = shared_from_this()](const asio::error_code& ec, std::size_t) {
    if (done_)
      return;
    if (ec) {
      Finish(LegStatus::NetworkError, "socks5 connect reply: " + ec.message());
      return;
    }
    if (static_cast<uint8_t>(buffer_[0]) != kSocksVersion) {
      Finish(LegStatus::NetworkError, "socks5 connect reply: bad version");
      return;
    }
    if (buffer_[1] != 0x00) {
      Finish(LegStatus::NetworkError,
             "socks5 connect failed with reply code " + std::to_string(static_cast<uint8_t>(buffer_[1])));
      return;
    }
    std::size_t remaining = 0;
    switch (static_cast<uint8_t>(buffer_[3])) {
      case kSocksAtypIPv4:
        remaining = 4 - 1 + 2;
        break;
      case kSocksAtypIPv6:
        remaining = 16 - 1 + 2;
        break;
      case kSocksAtypDomain:
        remaining = static_cast<uint8_t>(buffer_[4]) + 2;
        break;
      default:
        Finish(LegStatus::NetworkError, "socks5 connect reply: unknown address type");
        return;
    }
    asio::async_read(socket(), asio::buffer(buffer_.data(), remaining), [this, self](const asio::error_code& ec, std::size_t) {
      if (done_)
        return;
      if (ec) {
        Finish(LegStatus::NetworkError, "socks5 connect reply: " + ec.message());
        return;
      }
      if (tls_) {
        Handshake();
      } else {
        SendRequest();
      }
    });
  });
}

void HttpLeg::Handshake() {
  stream_.async_handshake(asio::ssl::stream_base::client, [this, self = shared_from_this()](const asio::error_code& ec) {
    if (done_)
      return;
    if (ec) {
      Finish(LegStatus::NetworkError, "tls handshake with " + request_.url.host + ": " + ec.message());
      return;
    }
    SendRequest();
  });
}

void HttpLeg::SendRequest() {
  out_ = "GET " + request_.url.target + " HTTP/1.1\r\n" +
         "Host: " + request_.url.HostHeader() + "\r\n" +
         "User-Agent: cdnscan\r\n"
         "Accept: */*\r\n"
         "Connection: close\r\n\r\n";

  auto on_write = [this, self = shared_from_this()](const asio::error_code& ec, std::size_t) {
    if (done_)
      return;
    if (ec) {
      Finish(LegStatus::NetworkError, "send request: " + ec.message());
      return;
    }
    ReadResponse();
  };
  if (tls_) {
    asio::async_write(stream_, asio::buffer(out_), on_write);
  } else {
    asio::async_write(socket(), asio::buffer(out_), on_write);
  }
}

void HttpLeg::ReadResponse() {
  auto on_read = [this, self = shared_from_this()](const asio::error_code& ec, std::size_t n) { OnRead(ec, n); };
  if (tls_) {
    stream_.async_read_some(asio::buffer(buffer_), on_read);
  } else {
    socket().async_read_some(asio::buffer(buffer_), on_read);
  }
}

void HttpLeg::OnRead(const asio::error_code& ec, std::size_t n) {
  if (done_)
    return;
  response_.append(buffer_.data(), n);
  if (response_.size() > MAX_RESPONSE_SIZE) {
    Finish(LegStatus::NetworkError, "response exceeds " + std::to_string(MAX_RESPONSE_SIZE) + " bytes");
    return;
  }
  bool eof = IsEof(ec);
  if (ec && !eof) {
    Finish(LegStatus::NetworkError, "read response: " + ec.message());
    return;
  }

  std::string body;
  switch (ParseHttpResponse(response_, eof, body)) {
    case HttpParseState::Invalid:
      Finish(LegStatus::NetworkError, "malformed HTTP response");
      return;
    case HttpParseState::Incomplete:
      if (eof) {
        Finish(LegStatus::NetworkError, "connection closed before response completed");
      } else {
        ReadResponse();
      }
      return;
    case HttpParseState::Complete:
      break;
  }

  if (body.find(request_.expected_body) == std::string::npos) {
    Finish(LegStatus::BodyMismatch, "expected text not found in " + std::to_string(body.size()) + "-byte body");
    return;
  }
  Finish(LegStatus::Ok, "");
}

void HttpLeg::Finish(LegStatus status, std::string detail) {
  if (done_)
    return;
  done_ = true;

  (void)timer_.cancel();
  resolver_.cancel();
  asio::error_code ignored;
  socket().close(ignored);

  LegResult result;
  result.status = status;
  result.rtt_ms = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_).count());
  result.detail = std::move(detail);

  LOG_PROBE_TRACE("{} {}: {} ({}ms) {}", request_.url.ToString(),
                  request_.connect_override ? request_.connect_override->to_string() : std::string("-"),
                  LegStatusName(status), result.rtt_ms, result.detail);

  auto callback = std::move(callback_);
  callback_ = nullptr;
  if (callback) {
    callback(std::move(result));
  }
}

}  // namespace probe
}  // namespace cdnscan
