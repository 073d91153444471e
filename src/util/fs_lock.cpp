// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unix/POSIX implementation

#include "util/fs_lock.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>

#include <fcntl.h>
#include <unistd.h>

namespace cdnscan {
namespace util {

namespace {

std::mutex g_dir_locks_mutex;

// Held directory locks, keyed by lock file path
std::map<std::string, std::unique_ptr<FileLock>> g_dir_locks;

}  // namespace

FileLock::FileLock(const fs::path& file) {
  // O_CLOEXEC keeps the lock fd out of the spawned tunnel process
  fd_ = open(file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ == -1) {
    reason_ = std::strerror(errno);
  }
}

FileLock::~FileLock() {
  if (fd_ != -1) {
    close(fd_);
  }
}

bool FileLock::TryLock() {
  if (fd_ == -1) {
    return false;
  }

  struct flock lock {};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0;  // whole file

  if (fcntl(fd_, F_SETLK, &lock) == -1) {
    reason_ = std::strerror(errno);
    return false;
  }
  return true;
}

LockResult LockDirectory(const fs::path& directory, const std::string& lockfile_name) {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);

  fs::path lockfile_path = directory / lockfile_name;
  std::string key = lockfile_path.string();

  if (g_dir_locks.find(key) != g_dir_locks.end()) {
    return LockResult::Success;
  }

  auto file_lock = std::make_unique<FileLock>(lockfile_path);
  if (!file_lock->IsOpen()) {
    LOG_SCAN_ERROR("Failed to open lock file {}: {}", key, file_lock->GetReason());
    return LockResult::ErrorWrite;
  }

  if (!file_lock->TryLock()) {
    LOG_SCAN_ERROR("Failed to lock data directory {}: {}", directory.string(), file_lock->GetReason());
    return LockResult::ErrorLock;
  }

  g_dir_locks.emplace(key, std::move(file_lock));
  LOG_SCAN_TRACE("Acquired data directory lock: {}", directory.string());
  return LockResult::Success;
}

void UnlockDirectory(const fs::path& directory, const std::string& lockfile_name) {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);

  auto it = g_dir_locks.find((directory / lockfile_name).string());
  if (it != g_dir_locks.end()) {
    LOG_SCAN_TRACE("Released data directory lock: {}", directory.string());
    g_dir_locks.erase(it);
  }
}

}  // namespace util
}  // namespace cdnscan
