#include "writelink/core/note.hpp"

#include "writelink/util/text.hpp"
#include "writelink/util/time.hpp"

namespace writelink::core {

Note::Note(NoteId id, std::string title, std::string content, TimePoint created,
           TimePoint updated)
    : id_(std::move(id)),
      title_(std::move(title)),
      content_(std::move(content)),
      created_(created),
      updated_(updated) {}

Note Note::create(const std::string& title, const std::string& content) {
  auto now = writelink::util::Time::now();
  return Note(NoteId::generate(), title, content, now, now);
}

Note Note::updatingContent(const std::string& content, TimePoint at) const {
  return Note(id_, title_, content, created_, at);
}

Note Note::updatingTitle(const std::string& title, TimePoint at) const {
  return Note(id_, title, content_, created_, at);
}

Note Note::updating(const std::string& title, const std::string& content, TimePoint at) const {
  return Note(id_, title, content, created_, at);
}

bool Note::isEmpty() const {
  return writelink::util::Text::trim(title_).empty() &&
         writelink::util::Text::trim(content_).empty();
}

bool Note::containsText(std::string_view text) const {
  if (text.empty()) {
    return true;
  }
  return writelink::util::Text::containsIgnoreCase(title_, text) ||
         writelink::util::Text::containsIgnoreCase(content_, text);
}

bool Note::operator==(const Note& other) const {
  return id_ == other.id_ &&
         title_ == other.title_ &&
         content_ == other.content_ &&
         created_ == other.created_ &&
         updated_ == other.updated_;
}

}  // namespace writelink::core
