// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/scan_driver.hpp"

#include "util/errors.hpp"
#include "util/logging.hpp"

#include <stdexcept>

namespace cdnscan {
namespace scan {

ScanDriver::ScanDriver(std::vector<AddressRange>& ranges, ResultStore& store, ScanCursor& cursor,
                       BatchProber& prober, Options options)
    : ranges_(ranges),
      store_(store),
      cursor_(cursor),
      prober_(prober),
      options_(std::move(options)),
      planner_(ranges_, cursor_, options_.planner) {
  total_work_ = planner_.TotalWork();
}

bool ScanDriver::Run(const std::atomic<bool>* stop_requested) {
  LOG_SCAN_INFO("scanning {} ranges from range {} offset {} ({} addresses, ceiling {} per range)", ranges_.size(),
                cursor_.range_index, cursor_.offset, total_work_, options_.planner.max_offset);
  while (RunBatch()) {
    if (stop_requested && stop_requested->load() && !planner_.Finished()) {
      LOG_SCAN_INFO("stopping at range {} offset {}; rerun to resume", cursor_.range_index, cursor_.offset);
      return false;
    }
  }
  LOG_SCAN_INFO("scan complete: {} batches, {} probed, {} succeeded, {} results stored", stats_.batches,
                stats_.probed, stats_.succeeded, store_.size());
  return true;
}

bool ScanDriver::RunBatch() {
  if (planner_.Finished()) {
    return false;
  }

  auto entries = planner_.NextBatch();
  std::size_t ok = 0;

  if (!entries.empty()) {
    std::vector<asio::ip::address> addresses;
    addresses.reserve(entries.size());
    for (const auto& entry : entries) {
      addresses.push_back(entry.address);
    }

    auto records = prober_.ProbeBatch(addresses);
    if (records.size() != entries.size()) {
      throw std::logic_error("prober returned " + std::to_string(records.size()) + " results for a batch of " +
                             std::to_string(entries.size()));
    }

    for (std::size_t i = 0; i < entries.size(); ++i) {
      if (!records[i]) {
        continue;
      }
      ++ok;
      store_.AddResult(entries[i].address, *records[i]);

      AddressRange& range = ranges_[entries[i].range_index];
      if (planner_.InWarmup(entries[i].offset) && !range.enabled()) {
        range.Enable();
        LOG_SCAN_DEBUG("range {} enabled by {}", range.ToString(), entries[i].address.to_string());
      }
    }
    store_.Commit();

    ++stats_.batches;
    stats_.probed += entries.size();
    stats_.succeeded += ok;
  }

  Persist(ok > 0);

  if (planner_.CrossedThreshold()) {
    std::size_t enabled = 0;
    for (const auto& range : ranges_) {
      if (range.enabled())
        ++enabled;
    }
    total_work_ = planner_.TotalWork();
    LOG_SCAN_INFO("enable threshold {} reached: {} of {} ranges remain eligible", options_.planner.enable_threshold,
                  enabled, ranges_.size());
  }

  ReportProgress(entries.size(), ok);
  return true;
}

void ScanDriver::Persist(bool results_changed) {
  // Results first: a cursor on disk must never run ahead of its results
  if (results_changed && !store_.SaveToFile(options_.result_path)) {
    throw StateError("cannot write result file " + options_.result_path.string());
  }
  if (!cursor_.SaveToFile(options_.cursor_path)) {
    throw StateError("cannot write scan cursor " + options_.cursor_path.string());
  }
}

void ScanDriver::ReportProgress(std::size_t batch_size, std::size_t batch_ok) const {
  uint64_t done = planner_.Finished() ? total_work_ : planner_.CompletedWork();
  double pct = total_work_ == 0 ? 100.0 : 100.0 * static_cast<double>(done) / static_cast<double>(total_work_);
  LOG_SCAN_INFO("progress: {}/{} ({:.1f}%) batch {}/{} ok, {} results", done, total_work_, pct, batch_ok, batch_size,
                store_.size());
}

}  // namespace scan
}  // namespace cdnscan
