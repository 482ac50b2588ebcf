#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "writelink/cli/application.hpp"

namespace writelink::cli {

class EditCommand : public Command {
public:
  explicit EditCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "edit"; }
  std::string description() const override { return "Change the title or content of a note"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string note_id_;
  std::string title_;
  std::string content_;
  CLI::Option* title_option_ = nullptr;
  CLI::Option* content_option_ = nullptr;
  bool from_stdin_ = false;
};

} // namespace writelink::cli
