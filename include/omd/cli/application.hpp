#pragma once

#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "omd/common.hpp"
#include "omd/config/config.hpp"
#include "omd/store/note_store.hpp"
#include "omd/util/error_handler.hpp"

namespace omd::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
  bool no_color = false;       // --no-color: Disable colored output
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
 */
class Application {
public:
  Application();
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  /**
   * @brief Load configuration, set up logging and the note store
   */
  Result<void> initialize();

  // Service accessors for commands
  const GlobalOptions& globalOptions() const;
  omd::config::Config& config();
  omd::store::NoteStore& noteStore();

  // Prints an error as JSON on stdout or as text on stderr
  void printError(const util::ContextualError& error) const;

private:
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  void registerCommand(std::unique_ptr<Command> command);

  Result<void> initializeServices();

  // CLI framework
  CLI::App app_;
  GlobalOptions global_options_;

  omd::config::Config config_;
  std::unique_ptr<omd::store::NoteStore> note_store_;
  bool services_initialized_;

  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace omd::cli
