#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "writelink/store/note_store.hpp"

namespace writelink::store {

// Stores each note as <NOTE-ID>.<extension> inside a single directory.
//
// Every public operation holds the store mutex, so writes to the same note
// never interleave within one process. Nothing is cached; each call goes to
// disk.
class FilesystemStore : public NoteStore {
 public:
  struct Config {
    std::filesystem::path notes_dir;
    // Without the leading dot
    std::string extension = "md";
  };

  // Creates notes_dir if needed. Fails with kFileSystemError when it cannot
  // be created or exists as something other than a directory.
  static Result<std::unique_ptr<FilesystemStore>> open(Config config);

  ~FilesystemStore() override = default;

  FilesystemStore(const FilesystemStore&) = delete;
  FilesystemStore& operator=(const FilesystemStore&) = delete;

  // NoteStore interface implementation
  Result<writelink::core::Note> create(const writelink::core::Note& note) override;
  Result<std::optional<writelink::core::Note>> read(const writelink::core::NoteId& id) override;
  Result<writelink::core::Note> update(const writelink::core::Note& note) override;
  Result<void> remove(const writelink::core::NoteId& id) override;
  Result<bool> exists(const writelink::core::NoteId& id) override;

  Result<std::vector<writelink::core::Note>> listAll() override;
  Result<std::vector<writelink::core::Note>> search(std::string_view query) override;
  Result<std::vector<writelink::core::Note>> listModifiedSince(
      std::chrono::system_clock::time_point since) override;

  const Config& config() const { return config_; }

  // Get file path for note
  std::filesystem::path getNotePath(const writelink::core::NoteId& id) const;

 private:
  explicit FilesystemStore(Config config);

  // Callers hold mutex_
  Result<bool> existsUnlocked(const writelink::core::NoteId& id) const;
  Result<void> writeNote(const writelink::core::Note& note);
  Result<std::vector<writelink::core::Note>> listAllUnlocked() const;

  Config config_;
  std::mutex mutex_;
};

}  // namespace writelink::store
