// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/result_store.hpp"

#include "util/errors.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <algorithm>
#include <string_view>

namespace cdnscan {
namespace scan {

namespace {

constexpr std::string_view kIpField = "ip: ";
constexpr std::string_view kOriginField = ", server_rtt: ";
constexpr std::string_view kCandidateField = ", cdn_rtt: ";

struct ParsedLine {
  asio::ip::address address;
  LatencyRecord record;
};

std::optional<ParsedLine> ParseLine(std::string_view line) {
  if (line.substr(0, kIpField.size()) != kIpField) {
    return std::nullopt;
  }
  auto origin_pos = line.find(kOriginField, kIpField.size());
  if (origin_pos == std::string_view::npos) {
    return std::nullopt;
  }
  auto candidate_pos = line.find(kCandidateField, origin_pos + kOriginField.size());
  if (candidate_pos == std::string_view::npos) {
    return std::nullopt;
  }

  // Keys are kept exactly as written: an IPv4-mapped IPv6 candidate stays
  // IPv6 so it still matches its range after a reload
  asio::error_code ec;
  auto address =
      asio::ip::make_address(std::string(line.substr(kIpField.size(), origin_pos - kIpField.size())), ec);
  auto origin = util::SafeParseUint64(
      line.substr(origin_pos + kOriginField.size(), candidate_pos - origin_pos - kOriginField.size()));
  auto candidate = util::SafeParseUint64(line.substr(candidate_pos + kCandidateField.size()));
  if (ec || !origin || !candidate) {
    return std::nullopt;
  }
  return ParsedLine{address, LatencyRecord{*origin, *candidate}};
}

}  // namespace

void ResultStore::AddResult(const asio::ip::address& address, const LatencyRecord& record) {
  records_[address] = record;
  staged_.insert(address);
}

bool ResultStore::Less(const asio::ip::address& a, const asio::ip::address& b) const {
  return records_.at(a) < records_.at(b);
}

void ResultStore::Commit() {
  if (staged_.empty()) {
    return;
  }

  std::vector<asio::ip::address> fresh(staged_.begin(), staged_.end());
  std::sort(fresh.begin(), fresh.end(), [this](const asio::ip::address& a, const asio::ip::address& b) {
    const auto& ra = records_.at(a);
    const auto& rb = records_.at(b);
    if (ra != rb)
      return ra < rb;
    return a < b;
  });

  std::vector<asio::ip::address> merged;
  merged.reserve(records_.size());

  std::size_t i = 0;
  std::size_t j = 0;
  while (i < ordered_.size() || j < fresh.size()) {
    // Entries that were re-measured in this batch move to their new slot
    if (i < ordered_.size() && staged_.count(ordered_[i]) != 0) {
      ++i;
      continue;
    }
    if (j == fresh.size()) {
      merged.push_back(ordered_[i++]);
    } else if (i == ordered_.size()) {
      merged.push_back(fresh[j++]);
    } else if (Less(ordered_[i], fresh[j])) {
      merged.push_back(ordered_[i++]);
    } else {
      merged.push_back(fresh[j++]);
    }
  }

  ordered_ = std::move(merged);
  staged_.clear();
}

std::optional<LatencyRecord> ResultStore::Get(const asio::ip::address& address) const {
  auto it = records_.find(address);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string ResultStore::Serialize() const {
  std::string out;
  out.reserve(ordered_.size() * 48);
  for (const auto& address : ordered_) {
    const auto& record = records_.at(address);
    out.append(kIpField);
    out.append(address.to_string());
    out.append(kOriginField);
    out.append(std::to_string(record.origin_rtt_ms));
    out.append(kCandidateField);
    out.append(std::to_string(record.candidate_rtt_ms));
    out.push_back('\n');
  }
  return out;
}

ResultStore ResultStore::Deserialize(const std::string& text, const std::string& source) {
  ResultStore store;
  std::size_t line_no = 0;
  std::size_t pos = 0;

  while (pos <= text.size()) {
    auto end = text.find('\n', pos);
    if (end == std::string::npos) {
      end = text.size();
    }
    std::string line = text.substr(pos, end - pos);
    pos = end + 1;
    ++line_no;

    line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
    if (line.empty()) {
      continue;
    }

    auto parsed = ParseLine(line);
    if (!parsed) {
      throw StateError(source + ":" + std::to_string(line_no) + ": malformed result line \"" + line + "\"");
    }
    if (!store.records_.emplace(parsed->address, parsed->record).second) {
      throw StateError(source + ":" + std::to_string(line_no) + ": duplicate address " + parsed->address.to_string());
    }
    store.ordered_.push_back(parsed->address);
  }

  auto by_record = [&store](const asio::ip::address& a, const asio::ip::address& b) { return store.Less(a, b); };
  if (!std::is_sorted(store.ordered_.begin(), store.ordered_.end(), by_record)) {
    LOG_SCAN_WARN("{}: results are not in latency order, re-sorting", source);
    std::stable_sort(store.ordered_.begin(), store.ordered_.end(), by_record);
  }
  return store;
}

bool ResultStore::SaveToFile(const std::filesystem::path& path) const {
  if (!util::atomic_write_file(path, Serialize())) {
    LOG_SCAN_ERROR("ResultStore: failed to save {} results to {}", ordered_.size(), path.string());
    return false;
  }
  LOG_SCAN_TRACE("ResultStore: saved {} results to {}", ordered_.size(), path.string());
  return true;
}

ResultStore ResultStore::LoadFromFile(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    LOG_SCAN_INFO("no result file at {}, starting with an empty result set", path.string());
    return ResultStore();
  }

  auto text = util::read_file_string(path);
  if (!text) {
    throw StateError("cannot read result file " + path.string());
  }
  return Deserialize(*text, path.string());
}

}  // namespace scan
}  // namespace cdnscan
