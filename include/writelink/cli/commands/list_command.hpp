#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "writelink/cli/application.hpp"

namespace writelink::cli {

class ListCommand : public Command {
public:
  explicit ListCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "ls"; }
  std::string description() const override { return "List notes, most recently modified first"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string since_;
};

} // namespace writelink::cli
