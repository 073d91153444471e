// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ScanDriver - batch loop of the scanner

 Each iteration:
   ScanPlanner::NextBatch() -> BatchProber::ProbeBatch() -> ResultStore
   AddResult()/Commit() -> persist result file and cursor -> log progress

 Persistence happens only at batch boundaries, so a restarted scan resumes
 at the last batch whose results are on disk. Per-address probe failures
 are not errors; a prober or persistence failure ends the run.
*/

#include "scan/address_range.hpp"
#include "scan/result_store.hpp"
#include "scan/scan_cursor.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

#include <asio/ip/address.hpp>

namespace cdnscan {
namespace scan {

/**
 * Measures one batch of candidates.
 *
 * Returns exactly one entry per address, in order; std::nullopt marks a
 * failed measurement. Fatal problems (e.g. the tunnel process cannot be
 * started) are thrown.
 */
class BatchProber {
public:
  virtual ~BatchProber() = default;
  virtual std::vector<std::optional<LatencyRecord>> ProbeBatch(const std::vector<asio::ip::address>& batch) = 0;
};

class ScanDriver {
public:
  struct Options {
    ScanPlanner::Options planner;
    std::filesystem::path result_path;
    std::filesystem::path cursor_path;
  };

  struct Stats {
    uint64_t batches{0};
    uint64_t probed{0};
    uint64_t succeeded{0};
  };

  // All references are borrowed for the driver's lifetime.
  ScanDriver(std::vector<AddressRange>& ranges, ResultStore& store, ScanCursor& cursor, BatchProber& prober,
             Options options);

  // Run batches until the scan is exhausted or *stop_requested becomes
  // true (checked between batches). Returns true if the scan finished.
  // Throws StateError if the result or cursor file cannot be written;
  // prober exceptions propagate.
  bool Run(const std::atomic<bool>* stop_requested = nullptr);

  // Run a single batch. Returns false (doing nothing) if the scan is
  // already finished.
  bool RunBatch();

  bool Finished() const { return planner_.Finished(); }
  const Stats& stats() const { return stats_; }
  uint64_t total_work() const { return total_work_; }

private:
  void Persist(bool results_changed);
  void ReportProgress(std::size_t batch_size, std::size_t batch_ok) const;

  std::vector<AddressRange>& ranges_;
  ResultStore& store_;
  ScanCursor& cursor_;
  BatchProber& prober_;
  Options options_;
  ScanPlanner planner_;
  Stats stats_;
  uint64_t total_work_{0};
};

}  // namespace scan
}  // namespace cdnscan
