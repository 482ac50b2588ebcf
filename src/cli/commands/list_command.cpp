#include "writelink/cli/commands/list_command.hpp"

#include <iostream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include "writelink/cli/command_error_handler.hpp"
#include "writelink/util/time.hpp"

namespace writelink::cli {

namespace {

void printNoteTable(const std::vector<writelink::core::Note>& notes) {
  for (const auto& note : notes) {
    std::cout << note.id().toString() << "  "
              << std::left << std::setw(24)
              << writelink::util::Time::toRfc3339(note.updated()) << "  "
              << note.title() << "\n";
  }
  std::cout << std::flush;
}

}  // namespace

ListCommand::ListCommand(Application& app) : app_(app) {
}

Result<int> ListCommand::execute(const GlobalOptions& options) {
  CommandErrorHandler error_handler(options);

  Result<std::vector<writelink::core::Note>> notes_result;
  if (since_.empty()) {
    notes_result = app_.noteService().listNotes();
  } else {
    auto since = writelink::util::Time::fromRfc3339(since_);
    if (!since.has_value()) {
      return error_handler.handleError(since.error());
    }
    notes_result = app_.noteService().listModifiedSince(*since);
  }

  if (!notes_result.has_value()) {
    return error_handler.handleError(notes_result.error(), "list");
  }

  if (options.json) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& note : *notes_result) {
      result.push_back(noteToJson(note));
    }
    std::cout << result.dump(2) << std::endl;
    return 0;
  }

  printNoteTable(*notes_result);
  return 0;
}

void ListCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("--since", since_,
                  "Only notes modified after this time (e.g. 2024-01-15T10:30:00.000Z)");
}

} // namespace writelink::cli
