#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "writelink/common.hpp"
#include "writelink/core/note.hpp"
#include "writelink/store/note_store.hpp"

namespace writelink::service {

// Editing operations on top of a NoteStore.
//
// Titles are trimmed and must not be blank. Edits that change nothing
// return the stored note without writing it.
class NoteService {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  // Uses Time::now() when no clock is given
  explicit NoteService(writelink::store::NoteStore& store, Clock clock = {});

  Result<writelink::core::Note> createNote(const std::string& title,
                                           const std::string& content = "");

  Result<writelink::core::Note> editContent(const writelink::core::NoteId& id,
                                            const std::string& content);
  Result<writelink::core::Note> editTitle(const writelink::core::NoteId& id,
                                          const std::string& title);
  Result<writelink::core::Note> edit(const writelink::core::NoteId& id,
                                     const std::string& title,
                                     const std::string& content);

  // Replace the stored record as is, timestamps included (sync path)
  Result<writelink::core::Note> replace(const writelink::core::Note& note);

  Result<void> deleteNote(const writelink::core::NoteId& id);

  // Fails with kNotFound when the note does not exist
  Result<writelink::core::Note> getNote(const writelink::core::NoteId& id);

  Result<std::vector<writelink::core::Note>> listNotes();
  Result<std::vector<writelink::core::Note>> searchNotes(const std::string& query);
  Result<std::vector<writelink::core::Note>> listModifiedSince(
      std::chrono::system_clock::time_point since);

 private:
  static Result<std::string> validateTitle(const std::string& title);

  writelink::store::NoteStore& store_;
  Clock clock_;
};

}  // namespace writelink::service
