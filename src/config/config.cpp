#include "writelink/config/config.hpp"

#include <sstream>

#include <toml++/toml.hpp>

#include "writelink/util/filesystem.hpp"
#include "writelink/util/logging.hpp"
#include "writelink/util/xdg.hpp"

namespace writelink::config {

Config::Config() {
  notes_dir = writelink::util::Xdg::notesDir();
  logging.file = writelink::util::Xdg::logFile();
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  auto exists = writelink::util::FileSystem::exists(config_path);
  if (!exists.has_value()) {
    return std::unexpected(exists.error());
  }
  if (!*exists) {
    return {};
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["notes_dir"].value<std::string>()) {
      notes_dir = *value;
    }
    if (auto value = config_data["file_extension"].value<std::string>()) {
      file_extension = *value;
    }

    if (auto logging_table = config_data["logging"].as_table()) {
      if (auto value = (*logging_table)["level"].value<std::string>()) {
        logging.level = *value;
      }
      if (auto value = (*logging_table)["file"].value<std::string>()) {
        logging.file = *value;
      }
    }

    return {};

  } catch (const toml::parse_error& e) {
    Error error(ErrorCode::kConfigError, "TOML parse error: " + std::string(e.description()));
    error.withSubject(config_path.string());
    return std::unexpected(std::move(error));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  toml::table config_data;
  config_data.insert_or_assign("notes_dir", notes_dir.string());
  config_data.insert_or_assign("file_extension", file_extension);

  auto logging_table = toml::table{};
  logging_table.insert_or_assign("level", logging.level);
  if (!logging.file.empty()) {
    logging_table.insert_or_assign("file", logging.file.string());
  }
  config_data.insert_or_assign("logging", logging_table);

  auto parent = save_path.parent_path();
  if (!parent.empty()) {
    auto dir_result = writelink::util::FileSystem::ensureDirectory(parent);
    if (!dir_result.has_value()) {
      return dir_result;
    }
  }

  std::stringstream ss;
  ss << config_data << '\n';
  auto write_result = writelink::util::FileSystem::writeFileAtomic(save_path, ss.str());
  if (!write_result.has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Cannot write config file: " + write_result.error().message()));
  }

  return {};
}

Result<void> Config::validate() const {
  if (notes_dir.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "notes_dir must not be empty"));
  }

  if (file_extension.empty() ||
      file_extension.find_first_of("./\\") != std::string::npos) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid file_extension: '" + file_extension + "'"));
  }

  auto level = writelink::util::parseLogLevel(logging.level);
  if (!level.has_value()) {
    return std::unexpected(level.error());
  }

  return {};
}

Result<Config> Config::fromFile(const std::filesystem::path& config_path) {
  Config config;

  auto load_result = config.load(config_path);
  if (!load_result.has_value()) {
    return std::unexpected(load_result.error());
  }

  auto validation = config.validate();
  if (!validation.has_value()) {
    return std::unexpected(validation.error());
  }

  return config;
}

std::filesystem::path Config::defaultConfigPath() {
  return writelink::util::Xdg::configFile();
}

}  // namespace writelink::config
