// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Scanner - startup sequence and main loop of the cdnscan binary

 1. Load ip-tester.json and the two tunnel templates from the data dir
 2. Parse the address source into ranges (optionally keep the first N)
 3. Lock the data dir, load result.txt and scan_cursor.json (unless
    no_cache), validate the cursor against the ranges
 4. Persist both once, enable ranges already covered by results
 5. Run the ScanDriver until the scan is exhausted or a signal arrives
*/

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>

namespace cdnscan {
namespace app {

struct ScannerOptions {
  std::filesystem::path datadir{"data"};
  std::filesystem::path ip_file;
  std::size_t subnet_count{0};  // 0 = all ranges
  bool no_cache{false};
  bool auto_skip{false};
  uint64_t enable_threshold{10};
  bool ignore_body_warning{false};
};

inline constexpr const char* CONFIG_FILE_NAME = "ip-tester.json";
inline constexpr const char* OUTBOUND_TEMPLATE_FILE_NAME = "outbound-template.json";
inline constexpr const char* TUNNEL_TEMPLATE_FILE_NAME = "sing-box-template.json";
inline constexpr const char* TUNNEL_CONFIG_FILE_NAME = "sing-box-test-config.json";
inline constexpr const char* RESULT_FILE_NAME = "result.txt";
inline constexpr const char* CURSOR_FILE_NAME = "scan_cursor.json";

class Scanner {
public:
  explicit Scanner(ScannerOptions options);
  ~Scanner();

  Scanner(const Scanner&) = delete;
  Scanner& operator=(const Scanner&) = delete;

  // Returns the process exit code: 0 when the scan is complete, 130 when
  // interrupted by SIGINT/SIGTERM (state is saved; rerun to resume).
  // Fatal errors are thrown (ConfigError, StateError, ProcessError).
  int Run();

  // Ask the main loop to stop after the current batch.
  void RequestStop() { stop_requested_ = true; }

private:
  void SetupSignalHandlers();
  static void SignalHandler(int signal);

  static Scanner* instance_;

  ScannerOptions options_;
  std::atomic<bool> stop_requested_{false};
  bool locked_{false};
};

}  // namespace app
}  // namespace cdnscan
