#include "writelink/util/logging.hpp"

#include <array>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace writelink::util {

namespace {

constexpr size_t kMaxLogFileSize = 1024 * 1024 * 5;  // 5MB files
constexpr size_t kMaxLogFiles = 3;
constexpr const char* kLoggerName = "writelink";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

}  // namespace

void initializeLogging(const LoggingOptions& options) {
  std::vector<spdlog::sink_ptr> sinks;

  if (options.console) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);
    sinks.push_back(console_sink);
  }

  std::string file_failure;
  if (!options.file.empty()) {
    try {
      auto parent = options.file.parent_path();
      if (!parent.empty()) {
        std::filesystem::create_directories(parent);
      }
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          options.file.string(), kMaxLogFileSize, kMaxLogFiles));
    } catch (const std::exception& e) {
      // Continue with whatever sinks remain
      file_failure = e.what();
    }
  }

  if (sinks.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
  }

  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(kPattern);
  logger->set_level(options.level);
  spdlog::set_default_logger(logger);

  if (!file_failure.empty()) {
    spdlog::warn("Failed to setup file logging: {}", file_failure);
  }
}

Result<spdlog::level::level_enum> parseLogLevel(std::string_view name) {
  static constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7>
      kLevels = {{
          {"trace", spdlog::level::trace},
          {"debug", spdlog::level::debug},
          {"info", spdlog::level::info},
          {"warn", spdlog::level::warn},
          {"error", spdlog::level::err},
          {"critical", spdlog::level::critical},
          {"off", spdlog::level::off},
      }};

  for (const auto& [level_name, level] : kLevels) {
    if (level_name == name) {
      return level;
    }
  }

  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Unknown log level: " + std::string(name)));
}

}  // namespace writelink::util
