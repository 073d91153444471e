// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "tunnel/tunnel_supervisor.hpp"

#include "util/errors.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"

#include <system_error>
#include <utility>

namespace cdnscan {
namespace tunnel {

namespace {

constexpr std::size_t kMaxTailBytes = 16 * 1024;
constexpr std::chrono::milliseconds kDrainPollInterval{100};
constexpr std::chrono::milliseconds kFinalDrainTimeout{500};
// After the first bytes arrive, allow the rest of the first line to follow
constexpr std::chrono::milliseconds kFirstLineGrace{50};

void AppendTail(std::string& tail, const std::string& chunk) {
  tail += chunk;
  if (tail.size() > kMaxTailBytes) {
    tail.erase(0, tail.size() - kMaxTailBytes);
  }
}

bool LooksLikeError(const std::string& output) {
  return output.find("FATAL") != std::string::npos || output.find("ERROR") != std::string::npos ||
         output.find("panic:") != std::string::npos;
}

std::string FirstLine(const std::string& output) {
  auto end = output.find('\n');
  return output.substr(0, end);
}

}  // namespace

// ---------------------------------------------------------------------------
// TunnelHandle
// ---------------------------------------------------------------------------

TunnelHandle::TunnelHandle(std::unique_ptr<ChildProcess> process, std::string initial_output,
                           std::chrono::milliseconds stop_grace)
    : process_(std::move(process)), drain_(std::make_unique<DrainState>()), stop_grace_(stop_grace) {
  AppendTail(drain_->tail, initial_output);
  drain_thread_ = std::thread(&TunnelHandle::DrainLoop, process_.get(), drain_.get());
}

TunnelHandle::~TunnelHandle() {
  Release();
}

TunnelHandle::TunnelHandle(TunnelHandle&& other) noexcept
    : process_(std::move(other.process_)),
      drain_(std::move(other.drain_)),
      drain_thread_(std::move(other.drain_thread_)),
      stop_grace_(other.stop_grace_) {}

TunnelHandle& TunnelHandle::operator=(TunnelHandle&& other) noexcept {
  if (this != &other) {
    Release();
    process_ = std::move(other.process_);
    drain_ = std::move(other.drain_);
    drain_thread_ = std::move(other.drain_thread_);
    stop_grace_ = other.stop_grace_;
  }
  return *this;
}

void TunnelHandle::DrainLoop(ChildProcess* process, DrainState* state) {
  std::string chunk;
  while (!state->stop.load(std::memory_order_acquire)) {
    chunk.clear();
    auto status = process->ReadSome(chunk, kDrainPollInterval);
    if (!chunk.empty()) {
      LOG_TUNNEL_TRACE("tunnel[{}]: {}", process->pid(), chunk);
      std::lock_guard<std::mutex> lock(state->mutex);
      AppendTail(state->tail, chunk);
    }
    if (status == ChildProcess::ReadStatus::Eof || status == ChildProcess::ReadStatus::Error) {
      break;
    }
  }
}

void TunnelHandle::Release() noexcept {
  if (!process_) {
    return;
  }
  pid_t pid = process_->pid();

  // Terminate first: the drain thread keeps the pipe from filling while
  // the process shuts down.
  process_->Terminate(stop_grace_);

  if (drain_) {
    drain_->stop.store(true, std::memory_order_release);
  }
  if (drain_thread_.joinable()) {
    try {
      drain_thread_.join();
    } catch (const std::system_error& e) {
      LOG_TUNNEL_WARN("failed to join tunnel output reader for pid {}: {}", pid, e.what());
    }
  }

  process_->CloseDiagnostics();
  LOG_TUNNEL_DEBUG("tunnel process {} released ({})", pid, process_->DescribeStatus());
  process_.reset();
}

std::string TunnelHandle::RecentOutput() const {
  if (!drain_) {
    return {};
  }
  std::lock_guard<std::mutex> lock(drain_->mutex);
  return drain_->tail;
}

// ---------------------------------------------------------------------------
// TunnelSupervisor
// ---------------------------------------------------------------------------

TunnelSupervisor::TunnelSupervisor(TunnelConfigTemplate config_template, Options options)
    : template_(std::move(config_template)), options_(std::move(options)) {}

TunnelHandle TunnelSupervisor::Start(const std::vector<asio::ip::address>& batch) {
  auto config = template_.Generate(batch, options_.listen_ip, options_.port_base);
  if (!util::atomic_write_file(options_.config_path, config.dump(2))) {
    throw StateError("cannot write tunnel config " + options_.config_path.string());
  }

  std::vector<std::string> argv{options_.binary, "run", "-c", options_.config_path.string()};
  auto process = ChildProcess::Spawn(argv);
  LOG_TUNNEL_DEBUG("started tunnel process {} for {} candidates", process->pid(), batch.size());

  // On throw, process's destructor terminates and reaps the child
  std::string initial = WaitUntilReady(*process);
  return TunnelHandle(std::move(process), std::move(initial), options_.stop_grace);
}

std::string TunnelSupervisor::WaitUntilReady(ChildProcess& process) {
  std::string output;
  auto status = process.ReadSome(output, options_.startup_timeout);

  if (status == ChildProcess::ReadStatus::Timeout) {
    if (process.IsRunning()) {
      LOG_TUNNEL_DEBUG("tunnel process {} silent for {}ms, assuming ready", process.pid(),
                       options_.startup_timeout.count());
      return output;
    }
    status = ChildProcess::ReadStatus::Eof;
  }

  if (status == ChildProcess::ReadStatus::Data) {
    if (output.find('\n') == std::string::npos) {
      (void)process.ReadSome(output, kFirstLineGrace);
    }
    if (!LooksLikeError(output)) {
      LOG_TUNNEL_DEBUG("tunnel process {} ready: {}", process.pid(), FirstLine(output));
      return output;
    }
    // Error report: give the process a chance to exit on its own
    process.WaitForExit(options_.stop_grace);
    process.Terminate(options_.stop_grace);
    output += process.Drain(kFinalDrainTimeout);
    throw ProcessError("tunnel process reported an error during startup (" + process.DescribeStatus() + ")",
                       output);
  }

  // EOF, read error or early exit
  process.WaitForExit(options_.stop_grace);
  process.Terminate(options_.stop_grace);
  output += process.Drain(kFinalDrainTimeout);
  throw ProcessError("tunnel process exited before becoming ready (" + process.DescribeStatus() + ")", output);
}

}  // namespace tunnel
}  // namespace cdnscan
