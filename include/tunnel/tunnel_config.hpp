// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 TunnelConfigTemplate - per-batch tunnel process configuration

 The tunnel process (sing-box compatible) is configured from two templates
 supplied by the user:
 - the base config: "inbounds", "outbounds" and "route.rules" arrays plus
   any other keys (log, dns, experimental, ...) which are kept verbatim
 - the outbound profile: protocol, port, credentials, TLS settings for one
   outbound; "tag" and "server" are filled in per candidate

 For batch member i the generated config gains
   inbound  {"type":"socks","tag":"inbound-i","listen":<ip>,"listen_port":port_base+i,...}
   outbound <profile> + {"tag":"outbound-i","server":<candidate>}
   rule     {"inbound":["inbound-i"],"outbound":"outbound-i"}
 so each local listener is routed to exactly one candidate.
*/

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <asio/ip/address.hpp>
#include <nlohmann/json.hpp>

namespace cdnscan {
namespace tunnel {

class TunnelConfigTemplate {
public:
  // Throws ConfigError if the base template lacks the arrays above or the
  // outbound profile is not a JSON object.
  TunnelConfigTemplate(nlohmann::json base_template, nlohmann::json outbound_template);

  // Throws ConfigError naming the file on read or parse failure.
  static TunnelConfigTemplate LoadFromFiles(const std::filesystem::path& base_path,
                                            const std::filesystem::path& outbound_path);

  nlohmann::json Generate(const std::vector<asio::ip::address>& targets, const std::string& listen_ip,
                          uint16_t port_base) const;

  static std::string InboundTag(std::size_t i) { return "inbound-" + std::to_string(i); }
  static std::string OutboundTag(std::size_t i) { return "outbound-" + std::to_string(i); }

private:
  nlohmann::json base_;
  nlohmann::json outbound_;
};

}  // namespace tunnel
}  // namespace cdnscan
