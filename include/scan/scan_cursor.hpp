// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ScanCursor / ScanPlanner - resumable round-robin enumeration

 Enumeration order: for offset = 0, 1, 2, ... visit every range once (in
 range-list order) before advancing the offset, so all ranges are sampled
 evenly over time. The (range_index, offset) pair of the next tick is the
 cursor; persisting it after each batch makes the scan resumable from the
 last completed batch boundary.

 Auto-skip: while offset < enable_threshold every range is probed (warm-up).
 From the threshold on, only ranges marked enabled are probed.
*/

#include "scan/address_range.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <asio/ip/address.hpp>

namespace cdnscan {
namespace scan {

struct ScanCursor {
  uint64_t range_index{0};
  uint64_t offset{0};

  friend bool operator==(const ScanCursor& a, const ScanCursor& b) {
    return a.range_index == b.range_index && a.offset == b.offset;
  }

  // {"range_index": N, "offset": M}
  std::string ToJson() const;
  // Throws StateError naming source on malformed input.
  static ScanCursor FromJson(const std::string& text, const std::string& source = "<memory>");

  bool SaveToFile(const std::filesystem::path& path) const;
  // std::nullopt if the file does not exist; StateError if unreadable or malformed.
  static std::optional<ScanCursor> LoadFromFile(const std::filesystem::path& path);

  // Throws StateError if the cursor cannot belong to a scan over
  // num_ranges ranges with the given ceiling. offset == max_offset is a
  // finished scan and is accepted.
  void Validate(std::size_t num_ranges, uint64_t max_offset, const std::string& source) const;
};

struct BatchEntry {
  asio::ip::address address;
  std::size_t range_index;
  uint64_t offset;  // offset the address was drawn at
};

class ScanPlanner {
public:
  struct Options {
    bool auto_skip{false};
    uint64_t enable_threshold{10};
    uint64_t max_offset{0};
    std::size_t batch_size{1};
  };

  // ranges and cursor are borrowed and must outlive the planner; the
  // planner advances cursor as it hands out batches.
  ScanPlanner(std::vector<AddressRange>& ranges, ScanCursor& cursor, const Options& options);

  bool Finished() const { return cursor_.offset >= options_.max_offset; }

  // Assemble the next batch by ticking the cursor until the batch is full
  // or the scan is exhausted. With auto-skip on, assembly also stops right
  // after the cursor crosses the enable threshold (see CrossedThreshold()).
  std::vector<BatchEntry> NextBatch();

  // True if the last NextBatch() moved the cursor onto the enable threshold.
  bool CrossedThreshold() const { return crossed_threshold_; }

  // True if a result drawn at offset may enable its range.
  bool InWarmup(uint64_t offset) const { return offset < options_.enable_threshold; }

  // Whether range_index is probed at the current cursor offset.
  bool IsEligible(std::size_t range_index) const;

  // Progress accounting for the current eligibility phase: total number of
  // addresses the scan will visit, and how many precede the cursor.
  uint64_t TotalWork() const;
  uint64_t CompletedWork() const;

  const Options& options() const { return options_; }

private:
  void Tick(std::vector<BatchEntry>& batch);
  uint64_t EffectiveLength(std::size_t range_index) const;
  bool AnyRangeLeftAt(uint64_t offset) const;

  std::vector<AddressRange>& ranges_;
  ScanCursor& cursor_;
  Options options_;
  bool crossed_threshold_{false};
};

}  // namespace scan
}  // namespace cdnscan
