#include "writelink/cli/application.hpp"

#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>

#include "writelink/cli/command_error_handler.hpp"
#include "writelink/util/logging.hpp"

// Command includes
#include "writelink/cli/commands/new_command.hpp"
#include "writelink/cli/commands/show_command.hpp"
#include "writelink/cli/commands/list_command.hpp"
#include "writelink/cli/commands/search_command.hpp"
#include "writelink/cli/commands/edit_command.hpp"
#include "writelink/cli/commands/remove_command.hpp"

namespace writelink::cli {

Application::Application()
    : app_("writelink", "Markdown notes kept as plain files") {

  app_.set_version_flag("--version", writelink::getVersion().toString());
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("--notes-dir", global_options_.notes_dir, "Override notes directory");
}

void Application::setupCommands() {
  registerCommand(std::make_unique<NewCommand>(*this));
  registerCommand(std::make_unique<ShowCommand>(*this));
  registerCommand(std::make_unique<ListCommand>(*this));
  registerCommand(std::make_unique<SearchCommand>(*this));
  registerCommand(std::make_unique<EditCommand>(*this));
  registerCommand(std::make_unique<RemoveCommand>(*this));
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  // Create CLI11 subcommand
  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  // Let the command setup its specific options
  cmd_ptr->setupCommand(sub);

  // Set callback to execute the command
  sub->callback([this, cmd_ptr]() {
    CommandErrorHandler error_handler(global_options_);

    // Initialize services before running command
    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      throw CLI::RuntimeError(error_handler.handleError(init_result.error(), "startup"));
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      throw CLI::RuntimeError(error_handler.handleError(result.error(), cmd_ptr->name()));
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  // Store the command
  commands_.push_back(std::move(command));
}

Result<void> Application::initializeServices() {
  if (note_service_) {
    return {};
  }

  // Console-only until the configured log file is known
  writelink::util::LoggingOptions early_logging;
  early_logging.console = global_options_.verbose > 0;
  writelink::util::initializeLogging(early_logging);

  std::filesystem::path config_path = global_options_.config_file.empty()
      ? writelink::config::Config::defaultConfigPath()
      : std::filesystem::path(global_options_.config_file);

  auto load_result = config_.load(config_path);
  if (!load_result.has_value()) {
    return load_result;
  }

  if (!global_options_.notes_dir.empty()) {
    config_.notes_dir = global_options_.notes_dir;
  }

  auto validation = config_.validate();
  if (!validation.has_value()) {
    return validation;
  }

  writelink::util::LoggingOptions logging_options;
  auto level = writelink::util::parseLogLevel(config_.logging.level);
  if (!level.has_value()) {
    return std::unexpected(level.error());
  }
  logging_options.level = global_options_.verbose > 1 ? spdlog::level::debug : *level;
  logging_options.file = config_.logging.file;
  logging_options.console = global_options_.verbose > 0;
  writelink::util::initializeLogging(logging_options);

  auto store = writelink::store::FilesystemStore::open(
      {config_.notes_dir, config_.file_extension});
  if (!store.has_value()) {
    return std::unexpected(store.error());
  }
  store_ = std::move(*store);
  note_service_ = std::make_unique<writelink::service::NoteService>(*store_);

  spdlog::debug("Using notes directory {}", config_.notes_dir.string());
  return {};
}

} // namespace writelink::cli
