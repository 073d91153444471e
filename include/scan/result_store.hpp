// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ResultStore - latency-ordered cache of probe results

 Purpose
 - Keep the latest LatencyRecord per candidate address
 - Keep an index of addresses sorted by (origin_rtt, candidate_rtt)
 - Fold a batch of new measurements into the index without re-sorting
   the whole history (merge-commit)
 - Persist to / restore from the human-readable result file

 Invariant (outside of an open batch): ordered() is a duplicate-free
 permutation of the mapping's keys, sorted by LatencyRecord. AddResult()
 opens a batch; Commit() closes it and restores the invariant.

 Not thread-safe: only the scan driver touches the store.
*/

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <asio/ip/address.hpp>

namespace cdnscan {
namespace scan {

struct LatencyRecord {
  uint64_t origin_rtt_ms{0};     // reference origin, through the tunnel
  uint64_t candidate_rtt_ms{0};  // CDN-facing endpoint on the candidate

  friend bool operator==(const LatencyRecord& a, const LatencyRecord& b) {
    return a.origin_rtt_ms == b.origin_rtt_ms && a.candidate_rtt_ms == b.candidate_rtt_ms;
  }
  friend bool operator!=(const LatencyRecord& a, const LatencyRecord& b) { return !(a == b); }
  friend bool operator<(const LatencyRecord& a, const LatencyRecord& b) {
    if (a.origin_rtt_ms != b.origin_rtt_ms)
      return a.origin_rtt_ms < b.origin_rtt_ms;
    return a.candidate_rtt_ms < b.candidate_rtt_ms;
  }
};

class ResultStore {
public:
  ResultStore() = default;

  // Record a measurement. The latest call for an address always wins.
  // The ordered index is not touched until Commit().
  void AddResult(const asio::ip::address& address, const LatencyRecord& record);

  // Merge staged addresses into the ordered index. O(n + m log m) for n
  // committed and m staged entries. No-op if nothing is staged.
  //
  // Tie-break: when a staged entry compares equal to a committed one, the
  // staged (newer) entry is placed first. Equal staged entries are ordered
  // by address so the result is deterministic.
  void Commit();

  std::size_t size() const { return records_.size(); }
  bool empty() const { return records_.empty(); }
  bool HasStaged() const { return !staged_.empty(); }

  const std::vector<asio::ip::address>& ordered() const { return ordered_; }
  std::optional<LatencyRecord> Get(const asio::ip::address& address) const;

  // One line per committed address, in committed order:
  //   ip: <address>, server_rtt: <origin ms>, cdn_rtt: <candidate ms>
  std::string Serialize() const;

  // Parse text produced by Serialize(). Any malformed line or duplicate
  // address rejects the whole input with StateError (source names the
  // file in the message). Blank lines and '\r' are ignored. Out-of-order
  // lines are tolerated and re-sorted with a warning.
  static ResultStore Deserialize(const std::string& text, const std::string& source = "<memory>");

  // Atomically rewrite path with Serialize(). Returns false on I/O failure.
  bool SaveToFile(const std::filesystem::path& path) const;

  // Missing file -> empty store. Unreadable or corrupt file -> StateError.
  static ResultStore LoadFromFile(const std::filesystem::path& path);

private:
  bool Less(const asio::ip::address& a, const asio::ip::address& b) const;

  std::unordered_map<asio::ip::address, LatencyRecord> records_;
  std::vector<asio::ip::address> ordered_;
  std::unordered_set<asio::ip::address> staged_;
};

}  // namespace scan
}  // namespace cdnscan
