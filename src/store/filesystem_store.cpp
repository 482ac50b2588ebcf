#include "writelink/store/filesystem_store.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "writelink/core/note_codec.hpp"
#include "writelink/util/filesystem.hpp"

namespace writelink::store {

using writelink::core::Note;
using writelink::core::NoteCodec;
using writelink::core::NoteId;
using writelink::util::FileSystem;

FilesystemStore::FilesystemStore(Config config) : config_(std::move(config)) {}

Result<std::unique_ptr<FilesystemStore>> FilesystemStore::open(Config config) {
  if (config.notes_dir.empty()) {
    return std::unexpected(makeFileSystemError("Notes directory not configured", ""));
  }

  auto dir_result = FileSystem::ensureDirectory(config.notes_dir);
  if (!dir_result.has_value()) {
    return std::unexpected(dir_result.error());
  }

  // Private constructor, so no make_unique
  return std::unique_ptr<FilesystemStore>(new FilesystemStore(std::move(config)));
}

Result<Note> FilesystemStore::create(const Note& note) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto exists_result = existsUnlocked(note.id());
  if (!exists_result.has_value()) {
    return std::unexpected(exists_result.error());
  }
  if (*exists_result) {
    Error error(ErrorCode::kAlreadyExists, "Note already exists: " + note.id().toString());
    error.withSubject(note.id().toString());
    return std::unexpected(std::move(error));
  }

  auto write_result = writeNote(note);
  if (!write_result.has_value()) {
    return std::unexpected(write_result.error());
  }

  spdlog::debug("Created note {}", note.id().toString());
  return note;
}

Result<std::optional<Note>> FilesystemStore::read(const NoteId& id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto exists_result = existsUnlocked(id);
  if (!exists_result.has_value()) {
    return std::unexpected(exists_result.error());
  }
  if (!*exists_result) {
    return std::optional<Note>{};
  }

  auto content_result = FileSystem::readFile(getNotePath(id));
  if (!content_result.has_value()) {
    return std::unexpected(content_result.error());
  }

  auto note_result = NoteCodec::deserialize(*content_result);
  if (!note_result.has_value()) {
    const auto& cause = note_result.error();
    Error error(ErrorCode::kDecodingError,
                "Cannot decode note " + id.toString() + ": " + cause.message());
    error.withSubject(id.toString()).withDetails(cause.details());
    return std::unexpected(std::move(error));
  }

  return std::optional<Note>(std::move(*note_result));
}

Result<Note> FilesystemStore::update(const Note& note) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto exists_result = existsUnlocked(note.id());
  if (!exists_result.has_value()) {
    return std::unexpected(exists_result.error());
  }
  if (!*exists_result) {
    Error error(ErrorCode::kNotFound, "Note not found: " + note.id().toString());
    error.withSubject(note.id().toString());
    return std::unexpected(std::move(error));
  }

  auto write_result = writeNote(note);
  if (!write_result.has_value()) {
    return std::unexpected(write_result.error());
  }

  spdlog::debug("Updated note {}", note.id().toString());
  return note;
}

Result<void> FilesystemStore::remove(const NoteId& id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto exists_result = existsUnlocked(id);
  if (!exists_result.has_value()) {
    return std::unexpected(exists_result.error());
  }
  if (!*exists_result) {
    Error error(ErrorCode::kNotFound, "Note not found: " + id.toString());
    error.withSubject(id.toString());
    return std::unexpected(std::move(error));
  }

  auto remove_result = FileSystem::removeFile(getNotePath(id));
  if (!remove_result.has_value()) {
    return remove_result;
  }

  spdlog::debug("Deleted note {}", id.toString());
  return {};
}

Result<bool> FilesystemStore::exists(const NoteId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return existsUnlocked(id);
}

Result<std::vector<Note>> FilesystemStore::listAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  return listAllUnlocked();
}

Result<std::vector<Note>> FilesystemStore::search(std::string_view query) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto notes_result = listAllUnlocked();
  if (!notes_result.has_value() || query.empty()) {
    return notes_result;
  }

  std::vector<Note> matches;
  for (auto& note : *notes_result) {
    if (note.containsText(query)) {
      matches.push_back(std::move(note));
    }
  }
  return matches;
}

Result<std::vector<Note>> FilesystemStore::listModifiedSince(
    std::chrono::system_clock::time_point since) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto notes_result = listAllUnlocked();
  if (!notes_result.has_value()) {
    return notes_result;
  }

  std::vector<Note> modified;
  for (auto& note : *notes_result) {
    if (note.updated() > since) {
      modified.push_back(std::move(note));
    }
  }
  return modified;
}

std::filesystem::path FilesystemStore::getNotePath(const NoteId& id) const {
  return config_.notes_dir / (id.toString() + "." + config_.extension);
}

Result<bool> FilesystemStore::existsUnlocked(const NoteId& id) const {
  return FileSystem::exists(getNotePath(id));
}

Result<void> FilesystemStore::writeNote(const Note& note) {
  auto write_result = FileSystem::writeFileAtomic(getNotePath(note.id()),
                                                  NoteCodec::serialize(note));
  if (!write_result.has_value()) {
    Error error = write_result.error();
    error.withSubject(note.id().toString());
    return std::unexpected(std::move(error));
  }
  return {};
}

Result<std::vector<Note>> FilesystemStore::listAllUnlocked() const {
  auto files_result = FileSystem::listDirectory(config_.notes_dir, "." + config_.extension);
  if (!files_result.has_value()) {
    return std::unexpected(files_result.error());
  }

  std::vector<Note> notes;
  notes.reserve(files_result->size());

  for (const auto& file : *files_result) {
    auto content_result = FileSystem::readFile(file);
    if (!content_result.has_value()) {
      spdlog::warn("Skipping unreadable note file {}: {}", file.string(),
                   content_result.error().message());
      continue;
    }

    auto note_result = NoteCodec::deserialize(*content_result);
    if (!note_result.has_value()) {
      spdlog::warn("Skipping undecodable note file {}: {}", file.string(),
                   describe(note_result.error()));
      continue;
    }

    notes.push_back(std::move(*note_result));
  }

  // Files arrive in name order, which settles ties
  std::stable_sort(notes.begin(), notes.end(), [](const Note& a, const Note& b) {
    return a.updated() > b.updated();
  });

  return notes;
}

}  // namespace writelink::store
