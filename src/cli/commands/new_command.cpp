#include "writelink/cli/commands/new_command.hpp"

#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include "writelink/cli/command_error_handler.hpp"

namespace writelink::cli {

NewCommand::NewCommand(Application& app) : app_(app) {
}

Result<int> NewCommand::execute(const GlobalOptions& options) {
  CommandErrorHandler error_handler(options);

  std::string content = content_;
  if (from_stdin_) {
    content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }

  auto note = app_.noteService().createNote(title_, content);
  if (!note.has_value()) {
    return error_handler.handleError(note.error(), "create");
  }

  if (options.json) {
    std::cout << noteToJson(*note).dump() << std::endl;
  } else if (!options.quiet) {
    std::cout << note->id().toString() << std::endl;
  }

  return 0;
}

void NewCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("title", title_, "Note title")->required();
  cmd->add_option("-c,--content", content_, "Note content");
  cmd->add_flag("--stdin", from_stdin_, "Read content from standard input");
}

} // namespace writelink::cli
