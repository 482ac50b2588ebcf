#include "writelink/cli/commands/show_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include "writelink/cli/command_error_handler.hpp"
#include "writelink/util/time.hpp"

namespace writelink::cli {

ShowCommand::ShowCommand(Application& app) : app_(app) {
}

Result<int> ShowCommand::execute(const GlobalOptions& options) {
  CommandErrorHandler error_handler(options);

  auto id = parseNoteIdArgument(note_id_);
  if (!id.has_value()) {
    return error_handler.handleError(id.error());
  }

  auto note = app_.noteService().getNote(*id);
  if (!note.has_value()) {
    return error_handler.handleError(note.error(), "show");
  }

  if (options.json) {
    std::cout << noteToJson(*note, true).dump(2) << std::endl;
    return 0;
  }

  std::cout << note->title() << "\n";
  if (options.verbose > 0) {
    std::cout << "id:       " << note->id().toString() << "\n";
    std::cout << "created:  " << writelink::util::Time::toRfc3339(note->created()) << "\n";
    std::cout << "modified: " << writelink::util::Time::toRfc3339(note->updated()) << "\n";
  }
  if (!note->content().empty()) {
    std::cout << "\n" << note->content() << "\n";
  }
  std::cout << std::flush;

  return 0;
}

void ShowCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("note_id", note_id_, "Note ID")->required();
}

} // namespace writelink::cli
