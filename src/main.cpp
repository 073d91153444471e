// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/scanner.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

void PrintUsage(const char *program_name) {
  std::cout
      << "cdnscan - CDN edge latency scanner\n\n"
      << "Usage: " << program_name << " --ip-file=<path> [options]\n\n"
      << "Options:\n"
      << "  --ip-file=<path>           Text file containing address ranges (a.b.c.d/n, x:y::/n)\n"
      << "  --subnet-count=<n>         Only scan the first n ranges (default: all)\n"
      << "  --datadir=<path>           Data directory (default: data)\n"
      << "  --no-cache                 Ignore saved results and scan position\n"
      << "  --auto-skip                Stop scanning ranges with no reachable address\n"
      << "                             after the warm-up offsets\n"
      << "  --enable-threshold=<n>     Warm-up offsets for --auto-skip (default: 10)\n"
      << "  --ignore-body-warning      Do not warn about unexpected response bodies\n"
      << "                             (otherwise capped at 200 per hour)\n"
      << "  --loglevel=<level>         Log level (trace, debug, info, warn, error, off),\n"
      << "                             optionally per component: info,probe:debug\n"
      << "  --logfile=<path>           Also write the log to a file\n"
      << "  --version                  Show version information\n"
      << "  --help                     Show this help message\n"
      << std::endl;
}

namespace {

std::vector<std::string> Split(const std::string &s, char sep) {
  std::vector<std::string> parts;
  std::string::size_type start = 0;
  while (true) {
    auto pos = s.find(sep, start);
    parts.push_back(s.substr(start, pos - start));
    if (pos == std::string::npos)
      break;
    start = pos + 1;
  }
  return parts;
}

}  // namespace

int main(int argc, char *argv[]) {
  try {
    cdnscan::app::ScannerOptions options;
    std::string loglevel = "info";
    std::string logfile;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--version" || arg == "-v") {
        std::cout << cdnscan::GetFullVersionString() << std::endl;
        std::cout << cdnscan::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.starts_with("--ip-file=")) {
        options.ip_file = arg.substr(10);
      } else if (arg.starts_with("--subnet-count=")) {
        auto n = cdnscan::util::SafeParseSize(arg.substr(15));
        if (!n) {
          std::cerr << "Error: Invalid --subnet-count value: " << arg.substr(15) << "\n";
          return 1;
        }
        options.subnet_count = *n;
      } else if (arg.starts_with("--datadir=")) {
        options.datadir = arg.substr(10);
        if (options.datadir.empty()) {
          std::cerr << "Error: --datadir requires a non-empty path\n";
          return 1;
        }
      } else if (arg == "--no-cache") {
        options.no_cache = true;
      } else if (arg == "--auto-skip") {
        options.auto_skip = true;
      } else if (arg.starts_with("--enable-threshold=")) {
        auto n = cdnscan::util::SafeParseUint64(arg.substr(19));
        if (!n) {
          std::cerr << "Error: Invalid --enable-threshold value: " << arg.substr(19) << "\n";
          return 1;
        }
        options.enable_threshold = *n;
      } else if (arg == "--ignore-body-warning") {
        options.ignore_body_warning = true;
      } else if (arg.starts_with("--loglevel=")) {
        loglevel = arg.substr(11);
      } else if (arg.starts_with("--logfile=")) {
        logfile = arg.substr(10);
      } else {
        std::cerr << "Error: Unknown option: " << arg << "\n";
        PrintUsage(argv[0]);
        return 1;
      }
    }

    if (options.ip_file.empty()) {
      std::cerr << "Error: --ip-file is required\n";
      PrintUsage(argv[0]);
      return 1;
    }

    // "info,probe:debug" -> global level, then per-component overrides
    std::string global_level = "info";
    std::vector<std::pair<std::string, std::string>> component_levels;
    for (const auto &entry : Split(loglevel, ',')) {
      auto colon = entry.find(':');
      if (colon == std::string::npos) {
        if (!entry.empty())
          global_level = entry;
      } else {
        component_levels.emplace_back(entry.substr(0, colon), entry.substr(colon + 1));
      }
    }

    cdnscan::util::LogManager::Initialize(global_level, !logfile.empty(), logfile.empty() ? "cdnscan.log" : logfile);
    for (const auto &[component, level] : component_levels) {
      cdnscan::util::LogManager::SetComponentLevel(component, level);
    }
    LOG_INFO("{} starting", cdnscan::GetFullVersionString());

    int rc = 0;
    {
      cdnscan::app::Scanner scanner(options);
      rc = scanner.Run();
    }

    cdnscan::util::LogManager::Shutdown();
    return rc;

  } catch (const std::exception &e) {
    cdnscan::util::LogManager::Shutdown();
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
