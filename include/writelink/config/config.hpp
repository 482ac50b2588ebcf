#pragma once

#include <filesystem>
#include <string>

#include "writelink/common.hpp"

namespace writelink::config {

// Application configuration, stored as TOML:
//
//   notes_dir = "/home/me/Documents/WriteLink"
//   file_extension = "md"
//
//   [logging]
//   level = "info"
//   file = "/home/me/.local/share/writelink/logs/writelink.log"
class Config {
 public:
  // Defaults only; nothing is read from disk
  Config();

  std::filesystem::path notes_dir;

  // Note file extension without the leading dot
  std::string file_extension = "md";

  struct LoggingConfig {
    std::string level = "info";
    std::filesystem::path file;
  };
  LoggingConfig logging;

  // Load values from a config file over the current ones. A missing file
  // leaves the defaults in place.
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration (to the loaded path when none is given)
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Check values for consistency
  Result<void> validate() const;

  // Defaults overlaid with the file at config_path, validated
  static Result<Config> fromFile(const std::filesystem::path& config_path);

  // Get default config path
  static std::filesystem::path defaultConfigPath();

  const std::filesystem::path& configPath() const { return config_path_; }

 private:
  std::filesystem::path config_path_;
};

}  // namespace writelink::config
