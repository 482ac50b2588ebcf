#pragma once

#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "writelink/common.hpp"
#include "writelink/config/config.hpp"
#include "writelink/service/note_service.hpp"
#include "writelink/store/filesystem_store.hpp"

namespace writelink::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
  std::string notes_dir;       // --notes-dir: Override notes directory
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

/**
 * @brief Main CLI application
 *
 * Owns the configuration, the one note store and the service built on it.
 * Services are created lazily, right before the selected command runs, so
 * --help and --version work without a notes directory.
 */
class Application {
public:
  Application();
  ~Application() = default;

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  // Service accessors for commands; valid once a command is executing
  const GlobalOptions& globalOptions() const { return global_options_; }
  const writelink::config::Config& config() const { return config_; }
  writelink::service::NoteService& noteService() { return *note_service_; }

private:
  void setupGlobalOptions();
  void setupCommands();

  void registerCommand(std::unique_ptr<Command> command);

  Result<void> initializeServices();

  CLI::App app_;
  GlobalOptions global_options_;

  writelink::config::Config config_;
  std::unique_ptr<writelink::store::FilesystemStore> store_;
  std::unique_ptr<writelink::service::NoteService> note_service_;

  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace writelink::cli
