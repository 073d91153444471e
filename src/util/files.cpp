// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/files.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace cdnscan {
namespace util {

namespace {

bool sync_directory(const std::filesystem::path& dir) {
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0)
    return false;
  bool result = fsync(fd) == 0;
  close(fd);
  return result;
}

// Random suffix for temp files; thread_local avoids re-seeding per call
std::string random_suffix() {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  static thread_local std::uniform_int_distribution<uint64_t> dis;
  char buf[20];
  snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(dis(gen)));
  return std::string(buf);
}

void remove_quietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    LOG_WARN("atomic_write_file: could not remove temp file {}: {}", path.string(), ec.message());
  }
}

}  // anonymous namespace

bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    LOG_ERROR("atomic_write_file: Failed to create parent directory: {}", parent.string());
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  // O_EXCL: never reuse a pre-existing temp file; O_NOFOLLOW: refuse symlinks
  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, mode);
  if (fd < 0) {
    LOG_ERROR("atomic_write_file: Failed to create temp file {}: {} (errno={})", temp_path.string(),
              std::strerror(errno), errno);
    return false;
  }

  // Handle partial writes
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0) {
      LOG_ERROR("atomic_write_file: Failed to write to temp file {}: {} (errno={}, written {}/{})", temp_path.string(),
                std::strerror(errno), errno, total, data.size());
      close(fd);
      remove_quietly(temp_path);
      return false;
    }
    total += static_cast<size_t>(n);
  }

  if (fsync(fd) != 0) {
    LOG_ERROR("atomic_write_file: Failed to fsync temp file {}: {} (errno={})", temp_path.string(),
              std::strerror(errno), errno);
    close(fd);
    remove_quietly(temp_path);
    return false;
  }

  close(fd);

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    LOG_ERROR("atomic_write_file: Failed to rename {} to {}: {} (code={})", temp_path.string(), path.string(),
              ec.message(), ec.value());
    remove_quietly(temp_path);
    return false;
  }

  // Make the rename itself durable
  if (!parent.empty() && !sync_directory(parent)) {
    LOG_WARN("atomic_write_file: Failed to fsync directory {} after writing {}: {}", parent.string(), path.string(),
             std::strerror(errno));
  }

  return true;
}

bool atomic_write_file(const std::filesystem::path& path, const std::string& data) {
  return atomic_write_file(path, data, 0644);
}

std::optional<std::string> read_file_string(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    LOG_ERROR("read_file: Failed to open file {}: {} (errno={})", path.string(), std::strerror(errno), errno);
    return std::nullopt;
  }

  std::streampos pos = file.tellg();
  if (pos == std::streampos(-1)) {
    LOG_ERROR("read_file: Failed to get file size for {}: {} (errno={})", path.string(), std::strerror(errno), errno);
    return std::nullopt;
  }

  auto size = static_cast<std::streamsize>(pos);
  if (size < 0 || static_cast<std::size_t>(size) > MAX_READ_FILE_SIZE) {
    LOG_ERROR("read_file: File {} has unsupported size {} (limit {}MB)", path.string(), size,
              MAX_READ_FILE_SIZE / 1024 / 1024);
    return std::nullopt;
  }

  std::string data(static_cast<std::size_t>(size), '\0');
  file.seekg(0);
  file.read(data.data(), size);

  if (!file) {
    LOG_ERROR("read_file: Failed to read {} bytes from {}: {} (errno={})", size, path.string(), std::strerror(errno),
              errno);
    return std::nullopt;
  }

  return data;
}

bool ensure_directory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::exists(dir);
}

}  // namespace util
}  // namespace cdnscan
