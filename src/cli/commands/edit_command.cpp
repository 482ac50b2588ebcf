#include "writelink/cli/commands/edit_command.hpp"

#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include "writelink/cli/command_error_handler.hpp"

namespace writelink::cli {

EditCommand::EditCommand(Application& app) : app_(app) {
}

Result<int> EditCommand::execute(const GlobalOptions& options) {
  CommandErrorHandler error_handler(options);

  auto id = parseNoteIdArgument(note_id_);
  if (!id.has_value()) {
    return error_handler.handleError(id.error());
  }

  bool set_title = title_option_->count() > 0;
  bool set_content = content_option_->count() > 0 || from_stdin_;
  if (!set_title && !set_content) {
    return error_handler.handleError(
        makeError(ErrorCode::kInvalidArgument, "Nothing to change: give --title, --content or --stdin"));
  }

  std::string content = content_;
  if (from_stdin_) {
    content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }

  auto& service = app_.noteService();
  Result<writelink::core::Note> note = set_title && set_content
      ? service.edit(*id, title_, content)
      : set_title ? service.editTitle(*id, title_)
                  : service.editContent(*id, content);
  if (!note.has_value()) {
    return error_handler.handleError(note.error(), "edit");
  }

  if (options.json) {
    std::cout << noteToJson(*note).dump() << std::endl;
  } else {
    error_handler.displaySuccess("Updated note: " + note->id().toString());
  }

  return 0;
}

void EditCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("note_id", note_id_, "Note ID")->required();
  title_option_ = cmd->add_option("-t,--title", title_, "New title");
  content_option_ = cmd->add_option("-c,--content", content_, "New content");
  cmd->add_flag("--stdin", from_stdin_, "Read new content from standard input");
}

} // namespace writelink::cli
