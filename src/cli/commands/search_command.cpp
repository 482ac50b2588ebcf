#include "writelink/cli/commands/search_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include "writelink/cli/command_error_handler.hpp"

namespace writelink::cli {

SearchCommand::SearchCommand(Application& app) : app_(app) {
}

Result<int> SearchCommand::execute(const GlobalOptions& options) {
  CommandErrorHandler error_handler(options);

  auto notes = app_.noteService().searchNotes(query_);
  if (!notes.has_value()) {
    return error_handler.handleError(notes.error(), "search");
  }

  if (options.json) {
    nlohmann::json result;
    result["query"] = query_;
    result["count"] = notes->size();
    result["notes"] = nlohmann::json::array();
    for (const auto& note : *notes) {
      result["notes"].push_back(noteToJson(note));
    }
    std::cout << result.dump(2) << std::endl;
    return 0;
  }

  for (const auto& note : *notes) {
    std::cout << note.id().toString() << "  " << note.title() << "\n";
  }
  if (!options.quiet) {
    std::cout << notes->size() << (notes->size() == 1 ? " note" : " notes") << " found\n";
  }
  std::cout << std::flush;

  return 0;
}

void SearchCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("query", query_, "Text to look for (case-insensitive)");
}

} // namespace writelink::cli
