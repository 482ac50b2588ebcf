#pragma once

#include <string>
#include <string_view>

#include "writelink/common.hpp"
#include "writelink/core/note.hpp"

namespace writelink::core {

// Converts notes to and from their on-disk text form:
//
//   ---
//   id: 123E4567-E89B-42D3-A456-426614174000
//   title: My Note
//   createdAt: 2024-01-15T10:30:00.000Z
//   modifiedAt: 2024-01-15T15:45:00.000Z
//   ---
//
//   Markdown content...
//
// The header is a line-oriented "key: value" block, not YAML. Only the four
// keys above are recognized; others are ignored when reading.
class NoteCodec {
 public:
  // Header and body halves of a serialized note
  struct Sections {
    std::string frontmatter;
    std::string content;
    bool has_header = false;
  };

  // Render a note. Never fails.
  static std::string serialize(const Note& note);

  // Parse a serialized note. Fails with kInvalidFrontmatter when the header
  // is absent or any required field is missing or unparseable; the error's
  // details() list the missing field names.
  static Result<Note> deserialize(std::string_view text);

  // Whether deserialize() would succeed
  static bool isValid(std::string_view text);

  // Body only (the whole input when there is no header block)
  static std::string extractContent(std::string_view text);

  // Raw header lines between the delimiters (empty when there is none)
  static std::string extractFrontmatter(std::string_view text);

  // Title quoting for the header line
  static std::string escapeTitle(std::string_view title);
  static std::string unescapeTitle(std::string_view value);

  static constexpr std::string_view kDelimiter = "---";

 private:
  static Sections split(std::string_view text);
};

}  // namespace writelink::core
