// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "tunnel/child_process.hpp"

#include "util/errors.hpp"
#include "util/logging.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cdnscan {
namespace tunnel {

namespace {

constexpr std::chrono::milliseconds kReapPollInterval{10};

void close_fd(int& fd) noexcept {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

}  // namespace

std::unique_ptr<ChildProcess> ChildProcess::Spawn(const std::vector<std::string>& argv) {
  if (argv.empty() || argv[0].empty()) {
    throw ProcessError("no tunnel binary configured", "");
  }

  int diag[2] = {-1, -1};
  if (pipe2(diag, O_CLOEXEC) != 0) {
    throw ProcessError(std::string("cannot create diagnostic pipe: ") + std::strerror(errno), "");
  }
  // Reports exec failure from the child; closes on successful exec
  int exec_err[2] = {-1, -1};
  if (pipe2(exec_err, O_CLOEXEC) != 0) {
    int saved = errno;
    close_fd(diag[0]);
    close_fd(diag[1]);
    throw ProcessError(std::string("cannot create exec status pipe: ") + std::strerror(saved), "");
  }

  // Build argv before fork: the child may only make async-signal-safe calls
  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    int saved = errno;
    close_fd(diag[0]);
    close_fd(diag[1]);
    close_fd(exec_err[0]);
    close_fd(exec_err[1]);
    throw ProcessError(std::string("fork failed: ") + std::strerror(saved), "");
  }

  if (pid == 0) {
    // Own process group: a terminal Ctrl-C stops the scanner between
    // batches, and the scanner then stops the tunnel itself
    setpgid(0, 0);
    int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
    }
    dup2(diag[1], STDOUT_FILENO);
    dup2(diag[1], STDERR_FILENO);
    execvp(args[0], args.data());
    int err = errno;
    ssize_t ignored = write(exec_err[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  close_fd(diag[1]);
  close_fd(exec_err[1]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = read(exec_err[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(exec_err[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    close_fd(diag[0]);
    throw ProcessError("cannot execute " + argv[0] + ": " + std::strerror(child_errno), "");
  }

  LOG_TUNNEL_DEBUG("spawned {} (pid {})", argv[0], pid);
  // Constructor is private, so std::make_unique cannot reach it
  return std::unique_ptr<ChildProcess>(new ChildProcess(pid, diag[0]));
}

ChildProcess::~ChildProcess() {
  Terminate(std::chrono::milliseconds(2000));
  CloseDiagnostics();
}

ChildProcess::ReadStatus ChildProcess::ReadSome(std::string& out, std::chrono::milliseconds timeout) {
  if (diag_fd_ < 0) {
    return ReadStatus::Eof;
  }

  struct pollfd pfd {};
  pfd.fd = diag_fd_;
  pfd.events = POLLIN;

  // A signal (the scanner's SIGINT/SIGTERM handler) must not cut the wait
  // short: Timeout means the full timeout really elapsed
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() < 0) {
      remaining = std::chrono::milliseconds(0);
    }

    int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (rc == 0) {
      return ReadStatus::Timeout;
    }
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return ReadStatus::Error;
    }

    char buf[4096];
    ssize_t n = read(diag_fd_, buf, sizeof(buf));
    if (n > 0) {
      out.append(buf, static_cast<std::size_t>(n));
      return ReadStatus::Data;
    }
    if (n == 0) {
      return ReadStatus::Eof;
    }
    if (errno != EINTR && errno != EAGAIN) {
      return ReadStatus::Error;
    }
  }
}

std::string ChildProcess::Drain(std::chrono::milliseconds timeout) {
  std::string out;
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      break;
    }
    if (ReadSome(out, remaining) != ReadStatus::Data) {
      break;
    }
  }
  return out;
}

bool ChildProcess::Reap(bool block) {
  if (exited_ || pid_ <= 0) {
    return true;
  }

  int status = 0;
  pid_t r;
  do {
    r = waitpid(pid_, &status, block ? 0 : WNOHANG);
  } while (r < 0 && errno == EINTR);

  if (r == pid_) {
    exited_ = true;
    wait_status_ = status;
    return true;
  }
  if (r < 0) {
    LOG_TUNNEL_WARN("waitpid({}) failed: {}", pid_, std::strerror(errno));
    exited_ = true;
    return true;
  }
  return false;
}

bool ChildProcess::IsRunning() {
  return !Reap(false);
}

bool ChildProcess::WaitForExit(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!Reap(false)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(kReapPollInterval);
  }
  return true;
}

void ChildProcess::Terminate(std::chrono::milliseconds grace) noexcept {
  if (!Reap(false)) {
    if (kill(pid_, SIGTERM) != 0 && errno != ESRCH) {
      LOG_TUNNEL_WARN("cannot send SIGTERM to tunnel process {}: {}", pid_, std::strerror(errno));
    }
    if (!WaitForExit(grace)) {
      LOG_TUNNEL_WARN("tunnel process {} ignored SIGTERM for {}ms, sending SIGKILL", pid_, grace.count());
      if (kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
        LOG_TUNNEL_WARN("cannot send SIGKILL to tunnel process {}: {}", pid_, std::strerror(errno));
      }
      Reap(true);
    }
    LOG_TUNNEL_TRACE("tunnel process {} stopped ({})", pid_, DescribeStatus());
  }
}

void ChildProcess::CloseDiagnostics() noexcept {
  close_fd(diag_fd_);
}

std::string ChildProcess::DescribeStatus() const {
  if (!exited_) {
    return "running";
  }
  if (WIFEXITED(wait_status_)) {
    return "exit status " + std::to_string(WEXITSTATUS(wait_status_));
  }
  if (WIFSIGNALED(wait_status_)) {
    return "killed by signal " + std::to_string(WTERMSIG(wait_status_));
  }
  return "stopped";
}

}  // namespace tunnel
}  // namespace cdnscan
