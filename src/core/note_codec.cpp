#include "writelink/core/note_codec.hpp"

#include <optional>
#include <sstream>
#include <vector>

#include "writelink/util/text.hpp"
#include "writelink/util/time.hpp"

namespace writelink::core {

namespace {

using writelink::util::Text;
using writelink::util::Time;

constexpr std::string_view kIdKey = "id";
constexpr std::string_view kTitleKey = "title";
constexpr std::string_view kCreatedKey = "createdAt";
constexpr std::string_view kModifiedKey = "modifiedAt";

// One physical line of the input; end is the offset just past its '\n'
struct Line {
  std::string_view text;
  size_t end;
};

std::optional<Line> nextLine(std::string_view text, size_t pos) {
  if (pos >= text.size()) {
    return std::nullopt;
  }
  size_t newline = text.find('\n', pos);
  if (newline == std::string_view::npos) {
    return Line{text.substr(pos), text.size()};
  }
  return Line{text.substr(pos, newline - pos), newline + 1};
}

bool isDelimiter(std::string_view line) {
  return Text::trim(line) == NoteCodec::kDelimiter;
}

bool needsQuoting(std::string_view title) {
  if (title.find_first_of(":\"\n\r") != std::string_view::npos) {
    return true;
  }
  // Values are trimmed on read
  return !title.empty() && Text::trim(title).size() != title.size();
}

}  // namespace

std::string NoteCodec::serialize(const Note& note) {
  std::ostringstream oss;

  oss << kDelimiter << '\n';
  oss << kIdKey << ": " << note.id().toString() << '\n';
  oss << kTitleKey << ": " << escapeTitle(note.title()) << '\n';
  oss << kCreatedKey << ": " << Time::toRfc3339(note.created()) << '\n';
  oss << kModifiedKey << ": " << Time::toRfc3339(note.updated()) << '\n';
  oss << kDelimiter << "\n\n";

  oss << note.content();

  return oss.str();
}

Result<Note> NoteCodec::deserialize(std::string_view text) {
  auto sections = split(text);

  std::optional<NoteId> id;
  std::optional<std::string> title;
  std::optional<Note::TimePoint> created;
  std::optional<Note::TimePoint> modified;

  std::istringstream header(sections.frontmatter);
  std::string line;
  while (std::getline(header, line)) {
    auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }

    std::string key = Text::trim(std::string_view(line).substr(0, colon));
    std::string value = Text::trim(std::string_view(line).substr(colon + 1));

    if (key == kIdKey) {
      auto parsed = NoteId::fromString(value);
      id = parsed.has_value() ? std::make_optional(*parsed) : std::nullopt;
    } else if (key == kTitleKey) {
      title = unescapeTitle(value);
    } else if (key == kCreatedKey) {
      auto parsed = Time::fromRfc3339(value);
      created = parsed.has_value() ? std::make_optional(*parsed) : std::nullopt;
    } else if (key == kModifiedKey) {
      auto parsed = Time::fromRfc3339(value);
      modified = parsed.has_value() ? std::make_optional(*parsed) : std::nullopt;
    }
    // Unknown keys are ignored
  }

  std::vector<std::string> missing;
  if (!id) missing.emplace_back(kIdKey);
  if (!title) missing.emplace_back(kTitleKey);
  if (!created) missing.emplace_back(kCreatedKey);
  if (!modified) missing.emplace_back(kModifiedKey);

  if (!missing.empty()) {
    std::string message = sections.has_header
        ? "Incomplete or invalid frontmatter"
        : "Missing or unterminated frontmatter header";
    Error error(ErrorCode::kInvalidFrontmatter, message);
    error.withDetails(std::move(missing));
    return std::unexpected(std::move(error));
  }

  return Note(std::move(*id), std::move(*title), std::move(sections.content),
              *created, *modified);
}

bool NoteCodec::isValid(std::string_view text) {
  return deserialize(text).has_value();
}

std::string NoteCodec::extractContent(std::string_view text) {
  return split(text).content;
}

std::string NoteCodec::extractFrontmatter(std::string_view text) {
  return split(text).frontmatter;
}

std::string NoteCodec::escapeTitle(std::string_view title) {
  if (!needsQuoting(title)) {
    return std::string(title);
  }

  std::string result;
  result.reserve(title.size() + 2);
  result += '"';
  for (char c : title) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      default:
        result += c;
    }
  }
  result += '"';
  return result;
}

std::string NoteCodec::unescapeTitle(std::string_view value) {
  bool quoted = value.size() >= 2 && value.front() == '"' && value.back() == '"';
  if (!quoted) {
    // Bare values only ever carry escaped quotes
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
      if (value[i] == '\\' && i + 1 < value.size() && value[i + 1] == '"') {
        result += '"';
        ++i;
      } else {
        result += value[i];
      }
    }
    return result;
  }

  std::string_view inner = value.substr(1, value.size() - 2);
  std::string result;
  result.reserve(inner.size());
  for (size_t i = 0; i < inner.size(); ++i) {
    if (inner[i] != '\\' || i + 1 == inner.size()) {
      result += inner[i];
      continue;
    }

    char next = inner[i + 1];
    switch (next) {
      case '"':
        result += '"';
        break;
      case '\\':
        result += '\\';
        break;
      case 'n':
        result += '\n';
        break;
      case 'r':
        result += '\r';
        break;
      default:
        // Unknown sequence, keep verbatim
        result += '\\';
        result += next;
    }
    ++i;
  }
  return result;
}

NoteCodec::Sections NoteCodec::split(std::string_view text) {
  auto first = nextLine(text, 0);
  if (!first || !isDelimiter(first->text)) {
    return {"", std::string(text), false};
  }

  size_t header_start = first->end;
  size_t pos = header_start;
  while (auto line = nextLine(text, pos)) {
    if (isDelimiter(line->text)) {
      std::string_view header = text.substr(header_start, pos - header_start);
      if (!header.empty() && header.back() == '\n') {
        header.remove_suffix(1);
      }
      return {std::string(header), Text::trim(text.substr(line->end)), true};
    }
    pos = line->end;
  }

  // No closing delimiter
  return {"", std::string(text), false};
}

}  // namespace writelink::core
