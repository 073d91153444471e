// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace cdnscan {

constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 3;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." + std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

inline std::string GetFullVersionString() {
  return "cdnscan v" + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (c) 2025 The Unicity Foundation\n"
         "Distributed under the MIT software license";
}

}  // namespace cdnscan
