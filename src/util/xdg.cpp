#include "writelink/util/xdg.hpp"

#include <cstdlib>
#include <filesystem>

namespace writelink::util {

std::filesystem::path Xdg::dataHome() {
  std::string xdg_data_home = getEnvVar("XDG_DATA_HOME", "");
  if (!xdg_data_home.empty()) {
    return std::filesystem::path(xdg_data_home) / "writelink";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".writelink_data";
  }

  return std::filesystem::path(home) / ".local" / "share" / "writelink";
}

std::filesystem::path Xdg::configHome() {
  std::string xdg_config_home = getEnvVar("XDG_CONFIG_HOME", "");
  if (!xdg_config_home.empty()) {
    return std::filesystem::path(xdg_config_home) / "writelink";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".writelink_config";
  }

  return std::filesystem::path(home) / ".config" / "writelink";
}

std::filesystem::path Xdg::documentsDir() {
  std::string xdg_documents = getEnvVar("XDG_DOCUMENTS_DIR", "");
  if (!xdg_documents.empty()) {
    return std::filesystem::path(xdg_documents);
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path();
  }

  return std::filesystem::path(home) / "Documents";
}

std::filesystem::path Xdg::notesDir() {
  return documentsDir() / "WriteLink";
}

std::filesystem::path Xdg::configFile() {
  return configHome() / "config.toml";
}

std::filesystem::path Xdg::logFile() {
  return dataHome() / "logs" / "writelink.log";
}

std::string Xdg::getEnvVar(const std::string& name, const std::string& default_value) {
  const char* value = std::getenv(name.c_str());
  return value ? std::string(value) : default_value;
}

}  // namespace writelink::util
