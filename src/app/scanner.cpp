// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/scanner.hpp"

#include "app/scan_config.hpp"
#include "app/tunnel_prober.hpp"
#include "probe/latency_probe.hpp"
#include "scan/address_range.hpp"
#include "scan/result_store.hpp"
#include "scan/scan_cursor.hpp"
#include "scan/scan_driver.hpp"
#include "tunnel/tunnel_config.hpp"
#include "tunnel/tunnel_supervisor.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include "util/logging.hpp"

#include <csignal>

#include <unistd.h>  // For write(), STDERR_FILENO (async-signal-safe)

namespace cdnscan {
namespace app {

Scanner* Scanner::instance_ = nullptr;

Scanner::Scanner(ScannerOptions options) : options_(std::move(options)) {
  instance_ = this;
}

Scanner::~Scanner() {
  if (locked_) {
    util::UnlockDirectory(options_.datadir, ".lock");
  }
  if (instance_ == this) {
    instance_ = nullptr;
  }
}

int Scanner::Run() {
  const auto& datadir = options_.datadir;
  LOG_INFO("Data directory: {}", datadir.string());

  auto config = ScanConfig::LoadFromFile(datadir / CONFIG_FILE_NAME);
  auto tunnel_template = tunnel::TunnelConfigTemplate::LoadFromFiles(datadir / TUNNEL_TEMPLATE_FILE_NAME,
                                                                    datadir / OUTBOUND_TEMPLATE_FILE_NAME);

  scan::AddressRangeParser parser;
  auto ranges = parser.LoadFile(options_.ip_file);
  if (options_.subnet_count > 0 && options_.subnet_count < ranges.size()) {
    LOG_INFO("Using the first {} of {} address ranges", options_.subnet_count, ranges.size());
    ranges.erase(ranges.begin() + static_cast<std::ptrdiff_t>(options_.subnet_count), ranges.end());
  }
  if (ranges.empty()) {
    throw StateError("no address ranges found in " + options_.ip_file.string());
  }
  uint64_t max_offset = scan::ComputeMaxOffset(ranges, config.max_subnet_len);
  LOG_INFO("Loaded {} address ranges, scanning up to {} addresses per range", ranges.size(), max_offset);

  util::LockResult lock_result = util::LockDirectory(datadir, ".lock");
  if (lock_result == util::LockResult::ErrorWrite) {
    throw StateError("cannot write to data directory " + datadir.string());
  }
  if (lock_result == util::LockResult::ErrorLock) {
    throw StateError("cannot obtain a lock on data directory " + datadir.string() +
                     "; another scanner is probably running");
  }
  locked_ = true;

  const auto result_path = datadir / RESULT_FILE_NAME;
  const auto cursor_path = datadir / CURSOR_FILE_NAME;

  scan::ResultStore store;
  scan::ScanCursor cursor;
  if (options_.no_cache) {
    LOG_INFO("Ignoring saved results and scan position (--no-cache)");
  } else {
    store = scan::ResultStore::LoadFromFile(result_path);
    if (auto saved = scan::ScanCursor::LoadFromFile(cursor_path)) {
      saved->Validate(ranges.size(), max_offset, cursor_path.string());
      cursor = *saved;
    }
    LOG_INFO("Resuming at range {} offset {} with {} saved results", cursor.range_index, cursor.offset, store.size());
  }

  if (!store.SaveToFile(result_path)) {
    throw StateError("cannot write result file " + result_path.string());
  }
  if (!cursor.SaveToFile(cursor_path)) {
    throw StateError("cannot write scan cursor " + cursor_path.string());
  }

  std::size_t enabled = scan::EnableRangesContaining(ranges, store.ordered());
  if (enabled > 0) {
    LOG_INFO("{} ranges enabled by saved results", enabled);
  }

  if (cursor.offset >= max_offset) {
    LOG_INFO("Scan already complete ({} results in {})", store.size(), result_path.string());
    return 0;
  }

  tunnel::TunnelSupervisor::Options tunnel_options;
  tunnel_options.binary = config.tunnel_binary;
  tunnel_options.config_path = datadir / TUNNEL_CONFIG_FILE_NAME;
  tunnel_options.listen_ip = config.listen_ip;
  tunnel_options.port_base = config.port_base;
  tunnel_options.startup_timeout = std::chrono::milliseconds(config.tunnel_startup_timeout_ms);
  tunnel::TunnelSupervisor supervisor(std::move(tunnel_template), tunnel_options);

  probe::ProbeSettings probe_settings;
  probe_settings.server_url = config.server_url;
  probe_settings.cdn_url = config.cdn_url;
  probe_settings.server_res_body = config.server_res_body;
  probe_settings.cdn_res_body = config.cdn_res_body;
  probe_settings.listen_ip = config.listen_ip;
  probe_settings.port_base = config.port_base;
  probe_settings.max_rtt = std::chrono::milliseconds(config.max_rtt);
  probe_settings.origin_via_tunnel = config.origin_via_tunnel;
  probe_settings.verify_tls = config.verify_tls;
  probe_settings.warn_on_body_mismatch = !options_.ignore_body_warning;
  probe::LatencyProbe probe(probe_settings);

  TunnelBatchProber prober(supervisor, probe);

  scan::ScanDriver::Options driver_options;
  driver_options.planner.auto_skip = options_.auto_skip;
  driver_options.planner.enable_threshold = options_.enable_threshold;
  driver_options.planner.max_offset = max_offset;
  driver_options.planner.batch_size = config.max_connection_count;
  driver_options.result_path = result_path;
  driver_options.cursor_path = cursor_path;
  scan::ScanDriver driver(ranges, store, cursor, prober, driver_options);

  SetupSignalHandlers();
  bool finished = driver.Run(&stop_requested_);

  LOG_INFO("Results saved to {}", result_path.string());
  return finished ? 0 : 130;
}

void Scanner::SetupSignalHandlers() {
  std::signal(SIGINT, Scanner::SignalHandler);
  std::signal(SIGTERM, Scanner::SignalHandler);
  // Ignore SIGPIPE: a tunnel that drops a connection mid-write must not kill us
  std::signal(SIGPIPE, SIG_IGN);
}

void Scanner::SignalHandler(int signal) {
  (void)signal;
  if (instance_) {
    static const char msg[] = "\nReceived signal, stopping after the current batch\n";
    (void)write(STDERR_FILENO, msg, sizeof(msg) - 1);
    instance_->stop_requested_ = true;
  }
}

}  // namespace app
}  // namespace cdnscan
