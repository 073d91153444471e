// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Fatal error types

 Anything thrown as one of these ends the run with a non-zero exit code.
 Per-probe failures are never reported this way; they are values
 (see probe::LegStatus).
*/

#include <stdexcept>
#include <string>

namespace cdnscan {

// Malformed configuration, template or command-line value.
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Persisted scan state (result file, cursor file, address source) that is
// unreadable, corrupt or inconsistent with the current run.
class StateError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The tunnel process could not be started or died before becoming ready.
// diagnostics() holds whatever the process wrote to its diagnostic stream.
class ProcessError : public std::runtime_error {
public:
  ProcessError(const std::string& what, std::string diagnostics)
      : std::runtime_error(diagnostics.empty() ? what : what + "\noutput:\n" + diagnostics),
        diagnostics_(std::move(diagnostics)) {}

  const std::string& diagnostics() const noexcept { return diagnostics_; }

private:
  std::string diagnostics_;
};

}  // namespace cdnscan
