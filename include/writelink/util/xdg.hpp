#pragma once

#include <filesystem>
#include <string>

namespace writelink::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG data home directory (~/.local/share/writelink)
  static std::filesystem::path dataHome();

  // Get XDG config home directory (~/.config/writelink)
  static std::filesystem::path configHome();

  // User documents directory (XDG_DOCUMENTS_DIR, else ~/Documents)
  static std::filesystem::path documentsDir();

  // Default notes directory (~/Documents/WriteLink)
  static std::filesystem::path notesDir();

  // Get config file path
  static std::filesystem::path configFile();

  // Get log file path
  static std::filesystem::path logFile();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace writelink::util
