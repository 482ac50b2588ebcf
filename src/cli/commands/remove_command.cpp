#include "writelink/cli/commands/remove_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include "writelink/cli/command_error_handler.hpp"

namespace writelink::cli {

RemoveCommand::RemoveCommand(Application& app) : app_(app) {
}

Result<int> RemoveCommand::execute(const GlobalOptions& options) {
  CommandErrorHandler error_handler(options);

  auto id = parseNoteIdArgument(note_id_);
  if (!id.has_value()) {
    return error_handler.handleError(id.error());
  }

  auto remove_result = app_.noteService().deleteNote(*id);
  if (!remove_result.has_value()) {
    return error_handler.handleError(remove_result.error(), "remove");
  }

  if (options.json) {
    nlohmann::json result_json;
    result_json["success"] = true;
    result_json["note_id"] = id->toString();
    std::cout << result_json.dump() << std::endl;
  } else {
    error_handler.displaySuccess("Deleted note: " + id->toString());
  }

  return 0;
}

void RemoveCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("note_id", note_id_, "Note ID to remove")->required();
}

} // namespace writelink::cli
