#pragma once

#include <filesystem>
#include <string_view>

#include <spdlog/common.h>

#include "writelink/common.hpp"

namespace writelink::util {

struct LoggingOptions {
  spdlog::level::level_enum level = spdlog::level::info;
  // Rotating log file; empty disables the file sink
  std::filesystem::path file;
  // Warnings and above are echoed to stderr
  bool console = true;
};

// Install the process-wide "writelink" logger. Falls back to console-only
// logging when the file sink cannot be created.
void initializeLogging(const LoggingOptions& options);

// Parse a level name (trace, debug, info, warn, error, critical, off)
Result<spdlog::level::level_enum> parseLogLevel(std::string_view name);

}  // namespace writelink::util
