// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "tunnel/tunnel_config.hpp"

#include "util/errors.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"

using json = nlohmann::json;

namespace cdnscan {
namespace tunnel {

namespace {

json LoadJsonFile(const std::filesystem::path& path, const char* what) {
  auto text = util::read_file_string(path);
  if (!text) {
    throw ConfigError(std::string("unable to load ") + what + " from " + path.string());
  }
  try {
    return json::parse(*text);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("unable to parse ") + what + " " + path.string() + ": " + e.what());
  }
}

}  // namespace

TunnelConfigTemplate::TunnelConfigTemplate(json base_template, json outbound_template)
    : base_(std::move(base_template)), outbound_(std::move(outbound_template)) {
  if (!base_.is_object()) {
    throw ConfigError("tunnel template must be a JSON object");
  }
  if (!base_.contains("inbounds") || !base_["inbounds"].is_array()) {
    throw ConfigError("tunnel template is missing the \"inbounds\" array");
  }
  if (!base_.contains("outbounds") || !base_["outbounds"].is_array()) {
    throw ConfigError("tunnel template is missing the \"outbounds\" array");
  }
  if (!base_.contains("route") || !base_["route"].is_object() || !base_["route"].contains("rules") ||
      !base_["route"]["rules"].is_array()) {
    throw ConfigError("tunnel template is missing the \"route.rules\" array");
  }
  if (!outbound_.is_object()) {
    throw ConfigError("outbound template must be a JSON object");
  }
}

TunnelConfigTemplate TunnelConfigTemplate::LoadFromFiles(const std::filesystem::path& base_path,
                                                         const std::filesystem::path& outbound_path) {
  json base = LoadJsonFile(base_path, "tunnel template");
  json outbound = LoadJsonFile(outbound_path, "outbound template");
  try {
    return TunnelConfigTemplate(std::move(base), std::move(outbound));
  } catch (const ConfigError& e) {
    throw ConfigError(std::string(e.what()) + " (" + base_path.string() + ", " + outbound_path.string() + ")");
  }
}

json TunnelConfigTemplate::Generate(const std::vector<asio::ip::address>& targets, const std::string& listen_ip,
                                    uint16_t port_base) const {
  json config = base_;
  auto& inbounds = config["inbounds"];
  auto& outbounds = config["outbounds"];
  auto& rules = config["route"]["rules"];

  for (std::size_t i = 0; i < targets.size(); ++i) {
    const std::string inbound_tag = InboundTag(i);
    const std::string outbound_tag = OutboundTag(i);

    inbounds.push_back({{"type", "socks"},
                        {"tag", inbound_tag},
                        {"listen", listen_ip},
                        {"listen_port", static_cast<uint16_t>(port_base + i)},
                        {"tcp_fast_open", true},
                        {"users", json::array()}});

    json outbound = outbound_;
    outbound["tag"] = outbound_tag;
    outbound["server"] = targets[i].to_string();
    outbounds.push_back(std::move(outbound));

    rules.push_back({{"inbound", json::array({inbound_tag})}, {"outbound", outbound_tag}});
  }

  LOG_TUNNEL_TRACE("generated tunnel config with {} listeners starting at {}:{}", targets.size(), listen_ip,
                   port_base);
  return config;
}

}  // namespace tunnel
}  // namespace cdnscan
