// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/scan_cursor.hpp"

#include "util/errors.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace cdnscan {
namespace scan {

// ============================================================================
// ScanCursor persistence
// ============================================================================

std::string ScanCursor::ToJson() const {
  json j = {{"range_index", range_index}, {"offset", offset}};
  return j.dump(2) + "\n";
}

ScanCursor ScanCursor::FromJson(const std::string& text, const std::string& source) {
  try {
    json j = json::parse(text);
    for (const char* key : {"range_index", "offset"}) {
      if (!j.at(key).is_number_unsigned()) {
        throw StateError("scan cursor " + source + ": '" + key + "' must be a non-negative integer");
      }
    }
    ScanCursor cursor;
    cursor.range_index = j.at("range_index").get<uint64_t>();
    cursor.offset = j.at("offset").get<uint64_t>();
    return cursor;
  } catch (const json::exception& e) {
    throw StateError("cannot parse scan cursor " + source + ": " + e.what());
  }
}

bool ScanCursor::SaveToFile(const std::filesystem::path& path) const {
  if (!util::atomic_write_file(path, ToJson())) {
    LOG_SCAN_ERROR("ScanCursor: failed to save {}", path.string());
    return false;
  }
  return true;
}

std::optional<ScanCursor> ScanCursor::LoadFromFile(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    LOG_SCAN_INFO("no scan cursor at {}, starting from the beginning", path.string());
    return std::nullopt;
  }
  auto text = util::read_file_string(path);
  if (!text) {
    throw StateError("cannot read scan cursor " + path.string());
  }
  return FromJson(*text, path.string());
}

void ScanCursor::Validate(std::size_t num_ranges, uint64_t max_offset, const std::string& source) const {
  if (range_index >= num_ranges) {
    throw StateError("scan cursor " + source + " is inconsistent: range_index " + std::to_string(range_index) +
                     " but only " + std::to_string(num_ranges) + " address ranges are loaded");
  }
  if (offset > max_offset) {
    throw StateError("scan cursor " + source + " is inconsistent: offset " + std::to_string(offset) +
                     " exceeds the per-range ceiling " + std::to_string(max_offset));
  }
}

// ============================================================================
// ScanPlanner
// ============================================================================

ScanPlanner::ScanPlanner(std::vector<AddressRange>& ranges, ScanCursor& cursor, const Options& options)
    : ranges_(ranges), cursor_(cursor), options_(options) {
  if (options_.batch_size == 0) {
    throw std::invalid_argument("ScanPlanner: batch_size must be positive");
  }
}

bool ScanPlanner::IsEligible(std::size_t range_index) const {
  return !options_.auto_skip || cursor_.offset < options_.enable_threshold || ranges_[range_index].enabled();
}

uint64_t ScanPlanner::EffectiveLength(std::size_t range_index) const {
  if (!IsEligible(range_index)) {
    return 0;
  }
  return std::min(ranges_[range_index].capacity(), options_.max_offset);
}

bool ScanPlanner::AnyRangeLeftAt(uint64_t offset) const {
  for (std::size_t i = 0; i < ranges_.size(); ++i) {
    if (IsEligible(i) && ranges_[i].capacity() > offset) {
      return true;
    }
  }
  return false;
}

void ScanPlanner::Tick(std::vector<BatchEntry>& batch) {
  std::size_t idx = static_cast<std::size_t>(cursor_.range_index);
  if (IsEligible(idx)) {
    if (auto ip = ranges_[idx].GetIp(cursor_.offset)) {
      batch.push_back(BatchEntry{*ip, idx, cursor_.offset});
    }
  }

  ++cursor_.range_index;
  if (cursor_.range_index == ranges_.size()) {
    cursor_.range_index = 0;
    ++cursor_.offset;
    if (options_.auto_skip && cursor_.offset == options_.enable_threshold) {
      crossed_threshold_ = true;
    }
  }
}

std::vector<BatchEntry> ScanPlanner::NextBatch() {
  std::vector<BatchEntry> batch;
  batch.reserve(options_.batch_size);
  crossed_threshold_ = false;

  while (batch.size() < options_.batch_size && !Finished()) {
    // Past the warm-up, whole offsets can be dead: jump straight to the end
    // once no eligible range reaches this far.
    if (cursor_.range_index == 0 && !AnyRangeLeftAt(cursor_.offset)) {
      LOG_SCAN_DEBUG("no eligible range extends past offset {}, finishing scan", cursor_.offset);
      cursor_.offset = options_.max_offset;
      break;
    }

    Tick(batch);
    if (crossed_threshold_) {
      break;
    }
  }
  return batch;
}

uint64_t ScanPlanner::TotalWork() const {
  uint64_t total = 0;
  for (std::size_t i = 0; i < ranges_.size(); ++i) {
    total += EffectiveLength(i);
  }
  return total;
}

uint64_t ScanPlanner::CompletedWork() const {
  uint64_t done = 0;
  for (std::size_t i = 0; i < ranges_.size(); ++i) {
    uint64_t len = EffectiveLength(i);
    done += std::min(len, cursor_.offset);
    // Ranges before the cursor were already visited at the current offset
    if (i < cursor_.range_index && cursor_.offset < len) {
      ++done;
    }
  }
  return done;
}

}  // namespace scan
}  // namespace cdnscan
