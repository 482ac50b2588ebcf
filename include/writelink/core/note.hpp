#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

#include "writelink/common.hpp"
#include "writelink/core/note_id.hpp"

namespace writelink::core {

// A note: identity, title, Markdown content and its two timestamps.
//
// Notes are values. The updating*() operations return a modified copy with
// updated() replaced and id()/created() preserved; they are the only
// operations that advance the modification time.
class Note {
 public:
  using TimePoint = std::chrono::system_clock::time_point;

  // Full constructor (used when reconstructing a stored note)
  Note(NoteId id, std::string title, std::string content, TimePoint created,
       TimePoint updated);

  // Create new note with a fresh id and both timestamps set to now
  static Note create(const std::string& title, const std::string& content = "");

  // Getters
  const NoteId& id() const noexcept { return id_; }
  const std::string& title() const noexcept { return title_; }
  const std::string& content() const noexcept { return content_; }
  const TimePoint& created() const noexcept { return created_; }
  const TimePoint& updated() const noexcept { return updated_; }

  // Copy with new content, stamped with the given modification time
  Note updatingContent(const std::string& content, TimePoint at) const;

  // Copy with new title, stamped with the given modification time
  Note updatingTitle(const std::string& title, TimePoint at) const;

  // Copy with new title and content
  Note updating(const std::string& title, const std::string& content, TimePoint at) const;

  // True when both title and content are blank
  bool isEmpty() const;

  std::size_t contentSizeInBytes() const noexcept { return content_.size(); }

  // Case-insensitive match against title or content
  bool containsText(std::string_view text) const;

  bool operator==(const Note& other) const;
  bool operator!=(const Note& other) const { return !(*this == other); }

 private:
  NoteId id_;
  std::string title_;
  std::string content_;
  TimePoint created_;
  TimePoint updated_;
};

}  // namespace writelink::core
