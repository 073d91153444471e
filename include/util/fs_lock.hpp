// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace cdnscan {
namespace util {

namespace fs = std::filesystem;

/**
 * POSIX advisory file lock (fcntl F_SETLK, exclusive).
 * The lock is released when the object is destroyed.
 */
class FileLock {
public:
  FileLock() = delete;
  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  explicit FileLock(const fs::path& file);
  ~FileLock();

  // Try to acquire the lock without blocking.
  bool TryLock();

  bool IsOpen() const { return fd_ != -1; }
  const std::string& GetReason() const { return reason_; }

private:
  std::string reason_;
  int fd_{-1};
};

enum class LockResult {
  Success,     // Lock acquired (or already held by this process)
  ErrorWrite,  // Could not create lock file
  ErrorLock,   // Lock held by another process
};

// Lock a data directory so that only one scanner persists into it. The
// lock is held until UnlockDirectory() or process exit.
LockResult LockDirectory(const fs::path& directory, const std::string& lockfile_name = ".lock");

void UnlockDirectory(const fs::path& directory, const std::string& lockfile_name = ".lock");

}  // namespace util
}  // namespace cdnscan
