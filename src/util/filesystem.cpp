#include "writelink/util/filesystem.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <random>

#ifdef _WIN32
#include <io.h>
#include <fcntl.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace writelink::util {

namespace {

void syncPath(const std::filesystem::path& path) {
#ifdef _WIN32
  int fd = _open(path.string().c_str(), _O_RDONLY);
  if (fd >= 0) {
    _commit(fd);
    _close(fd);
  }
#else
  int fd = open(path.c_str(), O_RDONLY);
  if (fd >= 0) {
    fsync(fd);
    close(fd);
  }
#endif
}

}  // namespace

// AtomicFileWriter implementation
AtomicFileWriter::AtomicFileWriter(const std::filesystem::path& target_path)
    : target_path_(target_path), committed_(false), cancelled_(false) {
  // Generate unique temporary filename
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(100000, 999999);

  // Hidden sibling so directory listings never pick it up
  temp_path_ = target_path_.parent_path() /
      ("." + target_path_.filename().string() + ".tmp." + std::to_string(dis(gen)));
}

AtomicFileWriter::~AtomicFileWriter() {
  if (!committed_ && !cancelled_) {
    cleanup();
  }
}

Result<void> AtomicFileWriter::write(const std::string& content) {
  if (committed_ || cancelled_) {
    return std::unexpected(makeFileSystemError("Writer already used", target_path_.string()));
  }

  std::ofstream file(temp_path_, std::ios::binary | std::ios::trunc);
  if (!file) {
    return std::unexpected(makeFileSystemError(
        "Cannot create temporary file " + temp_path_.string(), target_path_.string(),
        std::error_code(errno, std::generic_category())));
  }

  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!file) {
    cleanup();
    return std::unexpected(makeFileSystemError(
        "Failed to write to temporary file", target_path_.string(),
        std::error_code(errno, std::generic_category())));
  }

  file.close();
  if (!file) {
    cleanup();
    return std::unexpected(makeFileSystemError(
        "Failed to close temporary file", target_path_.string(),
        std::error_code(errno, std::generic_category())));
  }

  return {};
}

Result<void> AtomicFileWriter::commit() {
  if (committed_) {
    return std::unexpected(makeFileSystemError("Already committed", target_path_.string()));
  }
  if (cancelled_) {
    return std::unexpected(makeFileSystemError("Operation cancelled", target_path_.string()));
  }

  // Sync the temporary file
  syncPath(temp_path_);

  // Atomic rename
  std::error_code ec;
  std::filesystem::rename(temp_path_, target_path_, ec);
  if (ec) {
    cleanup();
    return std::unexpected(makeFileSystemError("Atomic rename failed",
                                               target_path_.string(), ec));
  }

  // Sync parent directory to ensure rename is persistent
  auto parent = target_path_.parent_path();
  if (!parent.empty()) {
    syncPath(parent);
  }

  committed_ = true;
  return {};
}

void AtomicFileWriter::cancel() {
  if (!committed_) {
    cancelled_ = true;
    cleanup();
  }
}

void AtomicFileWriter::cleanup() noexcept {
  std::error_code ec;
  std::filesystem::remove(temp_path_, ec);
}

// FileSystem implementation
Result<void> FileSystem::writeFileAtomic(const std::filesystem::path& path,
                                         const std::string& content) {
  AtomicFileWriter writer(path);

  auto write_result = writer.write(content);
  if (!write_result.has_value()) {
    return write_result;
  }

  return writer.commit();
}

Result<std::string> FileSystem::readFile(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected(makeFileSystemError(
        "Cannot open file", path.string(),
        std::error_code(errno, std::generic_category())));
  }

  file.seekg(0, std::ios::end);
  auto size = file.tellg();
  if (size < 0) {
    return std::unexpected(makeFileSystemError("Cannot get file size", path.string()));
  }

  file.seekg(0, std::ios::beg);

  std::string content(static_cast<size_t>(size), '\0');
  file.read(content.data(), size);

  if (!file) {
    return std::unexpected(makeFileSystemError("Read failed", path.string()));
  }

  return content;
}

Result<bool> FileSystem::exists(const std::filesystem::path& path) {
  std::error_code ec;
  bool found = std::filesystem::exists(path, ec);
  if (ec) {
    return std::unexpected(makeFileSystemError("Cannot access path", path.string(), ec));
  }
  return found;
}

Result<void> FileSystem::ensureDirectory(const std::filesystem::path& path,
                                         std::filesystem::perms perms) {
  std::error_code ec;
  auto status = std::filesystem::status(path, ec);

  if (ec && ec != std::errc::no_such_file_or_directory) {
    return std::unexpected(makeFileSystemError("Cannot access path", path.string(), ec));
  }

  if (std::filesystem::exists(status)) {
    if (!std::filesystem::is_directory(status)) {
      return std::unexpected(makeFileSystemError(
          "Path exists but is not a directory", path.string(),
          std::make_error_code(std::errc::not_a_directory)));
    }
    return {};
  }

  ec.clear();
  if (!std::filesystem::create_directories(path, ec) && ec) {
    return std::unexpected(makeFileSystemError("Cannot create directories",
                                               path.string(), ec));
  }

  std::filesystem::permissions(path, perms, ec);
  if (ec) {
    return std::unexpected(makeFileSystemError("Cannot set directory permissions",
                                               path.string(), ec));
  }

  return {};
}

Result<void> FileSystem::removeFile(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);

  if (ec) {
    return std::unexpected(makeFileSystemError("Cannot remove file", path.string(), ec));
  }

  return {};
}

Result<std::vector<std::filesystem::path>> FileSystem::listDirectory(
    const std::filesystem::path& path, const std::string& extension_filter) {
  std::vector<std::filesystem::path> results;
  std::error_code ec;

  std::filesystem::directory_iterator it(path, ec);
  if (ec) {
    return std::unexpected(makeFileSystemError("Cannot list directory", path.string(), ec));
  }

  const std::filesystem::directory_iterator end{};
  while (it != end) {
    const auto& entry = *it;
    std::error_code entry_ec;
    bool regular = entry.is_regular_file(entry_ec);
    if (regular && !entry_ec && !isHidden(entry.path()) &&
        (extension_filter.empty() || entry.path().extension() == extension_filter)) {
      results.push_back(entry.path());
    }

    it.increment(ec);
    if (ec) {
      return std::unexpected(makeFileSystemError("Cannot list directory", path.string(), ec));
    }
  }

  std::sort(results.begin(), results.end(),
            [](const auto& a, const auto& b) { return a.filename() < b.filename(); });

  return results;
}

bool FileSystem::isHidden(const std::filesystem::path& path) {
  auto name = path.filename().string();
  return !name.empty() && name.front() == '.';
}

}  // namespace writelink::util
