#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "writelink/cli/application.hpp"

namespace writelink::cli {

class NewCommand : public Command {
public:
  explicit NewCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "new"; }
  std::string description() const override { return "Create a new note"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string title_;
  std::string content_;
  bool from_stdin_ = false;
};

} // namespace writelink::cli
