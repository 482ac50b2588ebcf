#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "writelink/cli/application.hpp"
#include "writelink/core/note.hpp"

namespace writelink::cli {

// Formats command results and failures for the terminal or as JSON
class CommandErrorHandler {
public:
  explicit CommandErrorHandler(const GlobalOptions& options) : options_(options) {}

  // Report the error and return the exit code for it
  int handleError(const Error& error, const std::string& operation = "");

  void displaySuccess(const std::string& message);

private:
  const GlobalOptions& options_;
};

// JSON form of a note; the body is included only when requested
nlohmann::json noteToJson(const writelink::core::Note& note, bool include_content = false);

// Resolve a note id given on the command line
Result<writelink::core::NoteId> parseNoteIdArgument(const std::string& text);

} // namespace writelink::cli
