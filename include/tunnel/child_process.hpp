// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ChildProcess - fork/exec wrapper for the external tunnel binary

 The child's stdout and stderr share one pipe (the diagnostic stream);
 stdin is /dev/null. Every fd opened by this process is O_CLOEXEC, so the
 child only inherits the diagnostic pipe.

 Linux/macOS only.
*/

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace cdnscan {
namespace tunnel {

class ChildProcess {
public:
  enum class ReadStatus {
    Data,     // at least one byte appended
    Eof,      // all writers closed the pipe
    Timeout,  // nothing arrived in time
    Error,    // read/poll failed
  };

  // Throws ProcessError if the pipe cannot be created, fork fails or the
  // binary cannot be executed.
  static std::unique_ptr<ChildProcess> Spawn(const std::vector<std::string>& argv);

  ~ChildProcess();

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  pid_t pid() const { return pid_; }

  // Wait up to timeout for diagnostic output and append what is available.
  ReadStatus ReadSome(std::string& out, std::chrono::milliseconds timeout);

  // Read the diagnostic stream until EOF or until timeout elapses.
  std::string Drain(std::chrono::milliseconds timeout);

  // Reap the child if it has exited. Returns false once it is gone.
  bool IsRunning();

  // Wait up to timeout for the child to exit. True if it has exited.
  bool WaitForExit(std::chrono::milliseconds timeout);

  // SIGTERM, wait up to grace, then SIGKILL and reap. Safe to call more
  // than once; failures are logged, never thrown. The diagnostic pipe
  // stays open so a concurrent reader can collect the final output.
  void Terminate(std::chrono::milliseconds grace) noexcept;

  // Close our end of the diagnostic pipe. No reader may be active.
  void CloseDiagnostics() noexcept;

  // "exit status N", "killed by signal N" or "running".
  std::string DescribeStatus() const;

private:
  ChildProcess(pid_t pid, int diag_fd) : pid_(pid), diag_fd_(diag_fd) {}

  bool Reap(bool block);

  pid_t pid_{-1};
  int diag_fd_{-1};
  bool exited_{false};
  int wait_status_{0};
};

}  // namespace tunnel
}  // namespace cdnscan
