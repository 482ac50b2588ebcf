#include "writelink/cli/command_error_handler.hpp"

#include <iostream>

#include <spdlog/spdlog.h>

#include "writelink/util/time.hpp"

namespace writelink::cli {

int CommandErrorHandler::handleError(const Error& error, const std::string& operation) {
  if (operation.empty()) {
    spdlog::error("{}", describe(error));
  } else {
    spdlog::error("{} failed: {}", operation, describe(error));
  }

  if (options_.json) {
    nlohmann::json error_json;
    error_json["success"] = false;
    error_json["error"] = std::string(errorCodeToString(error.code()));
    error_json["message"] = error.message();
    if (!error.subject().empty()) {
      error_json["subject"] = error.subject();
    }
    if (!error.details().empty()) {
      error_json["details"] = error.details();
    }
    std::cout << error_json.dump() << std::endl;
  } else if (options_.verbose == 0) {
    // The logger already echoed it to stderr when verbose
    std::cerr << "Error: " << describe(error) << std::endl;
  }

  switch (error.code()) {
    case ErrorCode::kFileSystemError:
    case ErrorCode::kConfigError:
      return 2;
    default:
      return 1;
  }
}

void CommandErrorHandler::displaySuccess(const std::string& message) {
  if (options_.quiet) {
    return;
  }
  if (options_.json) {
    nlohmann::json success_json;
    success_json["success"] = true;
    success_json["message"] = message;
    std::cout << success_json.dump() << std::endl;
  } else {
    std::cout << message << std::endl;
  }
}

nlohmann::json noteToJson(const writelink::core::Note& note, bool include_content) {
  nlohmann::json note_json;
  note_json["id"] = note.id().toString();
  note_json["title"] = note.title();
  note_json["created"] = writelink::util::Time::toRfc3339(note.created());
  note_json["modified"] = writelink::util::Time::toRfc3339(note.updated());
  note_json["size"] = note.contentSizeInBytes();
  if (include_content) {
    note_json["content"] = note.content();
  }
  return note_json;
}

Result<writelink::core::NoteId> parseNoteIdArgument(const std::string& text) {
  auto id = writelink::core::NoteId::fromString(text);
  if (!id.has_value()) {
    Error error(ErrorCode::kInvalidArgument, "Not a note id: '" + text + "'");
    error.withSubject(text);
    return std::unexpected(std::move(error));
  }
  return id;
}

} // namespace writelink::cli
