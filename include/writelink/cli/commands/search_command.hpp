#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include "writelink/cli/application.hpp"

namespace writelink::cli {

class SearchCommand : public Command {
public:
  explicit SearchCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "search"; }
  std::string description() const override { return "Find notes whose title or content contains text"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  std::string query_;
};

} // namespace writelink::cli
