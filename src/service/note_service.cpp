#include "writelink/service/note_service.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "writelink/util/text.hpp"
#include "writelink/util/time.hpp"

namespace writelink::service {

using writelink::core::Note;
using writelink::core::NoteId;

NoteService::NoteService(writelink::store::NoteStore& store, Clock clock)
    : store_(store), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return writelink::util::Time::now(); };
  }
}

Result<Note> NoteService::createNote(const std::string& title, const std::string& content) {
  auto valid_title = validateTitle(title);
  if (!valid_title.has_value()) {
    return std::unexpected(valid_title.error());
  }

  auto now = clock_();
  Note note(NoteId::generate(), *valid_title, content, now, now);
  return store_.create(note);
}

Result<Note> NoteService::editContent(const NoteId& id, const std::string& content) {
  auto existing = getNote(id);
  if (!existing.has_value()) {
    return existing;
  }

  if (existing->content() == content) {
    spdlog::debug("Content of {} unchanged, skipping write", id.toString());
    return existing;
  }

  return store_.update(existing->updatingContent(content, clock_()));
}

Result<Note> NoteService::editTitle(const NoteId& id, const std::string& title) {
  auto valid_title = validateTitle(title);
  if (!valid_title.has_value()) {
    return std::unexpected(valid_title.error());
  }

  auto existing = getNote(id);
  if (!existing.has_value()) {
    return existing;
  }

  if (existing->title() == *valid_title) {
    return existing;
  }

  return store_.update(existing->updatingTitle(*valid_title, clock_()));
}

Result<Note> NoteService::edit(const NoteId& id, const std::string& title,
                               const std::string& content) {
  auto valid_title = validateTitle(title);
  if (!valid_title.has_value()) {
    return std::unexpected(valid_title.error());
  }

  auto existing = getNote(id);
  if (!existing.has_value()) {
    return existing;
  }

  if (existing->title() == *valid_title && existing->content() == content) {
    return existing;
  }

  return store_.update(existing->updating(*valid_title, content, clock_()));
}

Result<Note> NoteService::replace(const Note& note) {
  return store_.update(note);
}

Result<void> NoteService::deleteNote(const NoteId& id) {
  return store_.remove(id);
}

Result<Note> NoteService::getNote(const NoteId& id) {
  auto read_result = store_.read(id);
  if (!read_result.has_value()) {
    return std::unexpected(read_result.error());
  }

  if (!read_result->has_value()) {
    Error error(ErrorCode::kNotFound, "Note not found: " + id.toString());
    error.withSubject(id.toString());
    return std::unexpected(std::move(error));
  }

  return std::move(**read_result);
}

Result<std::vector<Note>> NoteService::listNotes() {
  return store_.listAll();
}

Result<std::vector<Note>> NoteService::searchNotes(const std::string& query) {
  return store_.search(query);
}

Result<std::vector<Note>> NoteService::listModifiedSince(
    std::chrono::system_clock::time_point since) {
  return store_.listModifiedSince(since);
}

Result<std::string> NoteService::validateTitle(const std::string& title) {
  std::string trimmed = writelink::util::Text::trim(title);
  if (trimmed.empty()) {
    return std::unexpected(makeError(ErrorCode::kValidationError, "Title cannot be empty"));
  }
  return trimmed;
}

}  // namespace writelink::service
