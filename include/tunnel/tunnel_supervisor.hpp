// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 TunnelSupervisor - per-batch lifecycle of the external tunnel process

 Start() writes the generated config, spawns the binary and performs a
 bounded readiness check on its diagnostic stream:
 - first output that is not an error report   -> ready
 - error report, EOF or exit before any output -> ProcessError carrying
   the drained output
 - silence for the whole startup timeout while the process is alive -> ready

 The returned TunnelHandle exclusively owns the process. Release() (or
 destruction) terminates and reaps it before returning, so the listener
 ports are free before the next batch starts.
*/

#include "tunnel/child_process.hpp"
#include "tunnel/tunnel_config.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <asio/ip/address.hpp>

namespace cdnscan {
namespace tunnel {

class TunnelHandle {
public:
  TunnelHandle() = default;
  TunnelHandle(std::unique_ptr<ChildProcess> process, std::string initial_output, std::chrono::milliseconds stop_grace);
  ~TunnelHandle();

  TunnelHandle(TunnelHandle&& other) noexcept;
  TunnelHandle& operator=(TunnelHandle&& other) noexcept;
  TunnelHandle(const TunnelHandle&) = delete;
  TunnelHandle& operator=(const TunnelHandle&) = delete;

  // Terminate and reap the process, stop the drain thread. Idempotent;
  // problems are logged as warnings and never propagate.
  void Release() noexcept;

  bool active() const { return process_ != nullptr; }
  pid_t pid() const { return process_ ? process_->pid() : -1; }

  // Last few KiB of the process's diagnostic output.
  std::string RecentOutput() const;

private:
  // Shared with the drain thread; heap-allocated so moves do not
  // invalidate the thread's pointer.
  struct DrainState {
    std::atomic<bool> stop{false};
    mutable std::mutex mutex;
    std::string tail;
  };

  static void DrainLoop(ChildProcess* process, DrainState* state);

  std::unique_ptr<ChildProcess> process_;
  std::unique_ptr<DrainState> drain_;
  std::thread drain_thread_;
  std::chrono::milliseconds stop_grace_{2000};
};

class TunnelSupervisor {
public:
  struct Options {
    std::string binary{"./sing-box"};
    std::filesystem::path config_path;
    std::string listen_ip{"127.0.0.1"};
    uint16_t port_base{10000};
    std::chrono::milliseconds startup_timeout{5000};
    std::chrono::milliseconds stop_grace{2000};
  };

  TunnelSupervisor(TunnelConfigTemplate config_template, Options options);

  // Throws ProcessError if the process cannot be started or fails its
  // readiness check, StateError if the config file cannot be written.
  TunnelHandle Start(const std::vector<asio::ip::address>& batch);

  const Options& options() const { return options_; }

private:
  std::string WaitUntilReady(ChildProcess& process);

  TunnelConfigTemplate template_;
  Options options_;
};

}  // namespace tunnel
}  // namespace cdnscan
