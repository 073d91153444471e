// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace cdnscan {
namespace util {

// Largest file read_file_string() will load (result files of a full IPv4
// scan stay well below this).
constexpr std::size_t MAX_READ_FILE_SIZE = 256 * 1024 * 1024;

// Write data to path atomically: temp file in the same directory, fsync,
// directory fsync, rename. The parent directory is created if missing.
// Returns false (and logs the cause) on any failure; the target is then
// left untouched.
bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode);
bool atomic_write_file(const std::filesystem::path& path, const std::string& data);

// Read a whole file. Returns std::nullopt (and logs the cause) if the file
// cannot be opened or read, or exceeds MAX_READ_FILE_SIZE.
std::optional<std::string> read_file_string(const std::filesystem::path& path);

// Create directory (and parents). Returns true if it exists afterwards.
bool ensure_directory(const std::filesystem::path& dir);

}  // namespace util
}  // namespace cdnscan
