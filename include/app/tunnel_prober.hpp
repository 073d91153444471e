// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "probe/latency_probe.hpp"
#include "scan/scan_driver.hpp"
#include "tunnel/tunnel_supervisor.hpp"

namespace cdnscan {
namespace app {

// Production BatchProber: one tunnel process per batch, stopped before
// ProbeBatch() returns so the listener ports are free for the next batch.
class TunnelBatchProber : public scan::BatchProber {
public:
  TunnelBatchProber(tunnel::TunnelSupervisor& supervisor, probe::LatencyProbe& probe)
      : supervisor_(supervisor), probe_(probe) {}

  std::vector<std::optional<scan::LatencyRecord>> ProbeBatch(const std::vector<asio::ip::address>& batch) override;

private:
  tunnel::TunnelSupervisor& supervisor_;
  probe::LatencyProbe& probe_;
};

}  // namespace app
}  // namespace cdnscan
