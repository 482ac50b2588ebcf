#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "writelink/common.hpp"

namespace writelink::util {

// Atomic file replacement: content goes to a hidden sibling temp file which
// is renamed over the target on commit(). A writer destroyed without
// commit() removes its temp file and leaves the target untouched.
class AtomicFileWriter {
 public:
  explicit AtomicFileWriter(const std::filesystem::path& target_path);
  ~AtomicFileWriter();

  // Non-copyable, movable
  AtomicFileWriter(const AtomicFileWriter&) = delete;
  AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;
  AtomicFileWriter(AtomicFileWriter&&) = default;
  AtomicFileWriter& operator=(AtomicFileWriter&&) = default;

  // Write content to temporary file
  Result<void> write(const std::string& content);

  // Commit the changes (rename temp to target)
  Result<void> commit();

  // Cancel the operation (removes temp file)
  void cancel();

  const std::filesystem::path& targetPath() const { return target_path_; }
  const std::filesystem::path& tempPath() const { return temp_path_; }

 private:
  std::filesystem::path target_path_;
  std::filesystem::path temp_path_;
  bool committed_;
  bool cancelled_;

  void cleanup() noexcept;
};

// Filesystem utilities. Failures are reported as kFileSystemError carrying
// the path as subject and the OS error where one exists.
class FileSystem {
 public:
  // Atomic write with fsync and rename
  static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                      const std::string& content);

  // Read whole file
  static Result<std::string> readFile(const std::filesystem::path& path);

  // Whether anything exists at path
  static Result<bool> exists(const std::filesystem::path& path);

  // Create directory (and parents) if missing; fails if path exists as a
  // non-directory
  static Result<void> ensureDirectory(const std::filesystem::path& path,
                                      std::filesystem::perms perms = std::filesystem::perms::owner_all);

  // Remove file
  static Result<void> removeFile(const std::filesystem::path& path);

  // Regular, non-hidden files in path with the given extension (".md" form,
  // empty for any), sorted by file name
  static Result<std::vector<std::filesystem::path>> listDirectory(
      const std::filesystem::path& path,
      const std::string& extension_filter = "");

 private:
  static bool isHidden(const std::filesystem::path& path);
};

}  // namespace writelink::util
