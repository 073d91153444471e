// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/tunnel_prober.hpp"

#include "util/logging.hpp"

namespace cdnscan {
namespace app {

std::vector<std::optional<scan::LatencyRecord>> TunnelBatchProber::ProbeBatch(
    const std::vector<asio::ip::address>& batch) {
  auto tunnel = supervisor_.Start(batch);
  auto records = probe_.Run(batch);

  std::size_t ok = 0;
  for (const auto& record : records) {
    if (record)
      ++ok;
  }
  if (ok == 0 && !batch.empty()) {
    // Nothing got through: the tunnel log usually says why
    std::string output = tunnel.RecentOutput();
    if (!output.empty()) {
      LOG_TUNNEL_DEBUG("no successful probes in batch; recent tunnel output:\n{}", output);
    }
  }

  tunnel.Release();
  return records;
}

}  // namespace app
}  // namespace cdnscan
