#include "omd/cli/application.hpp"

#include <iostream>

#include <spdlog/spdlog.h>

#include "omd/store/filesystem_store.hpp"

#include "omd/cli/commands/add_command.hpp"
#include "omd/cli/commands/append_command.hpp"
#include "omd/cli/commands/config_command.hpp"
#include "omd/cli/commands/dedupe_command.hpp"
#include "omd/cli/commands/get_command.hpp"
#include "omd/cli/commands/move_command.hpp"
#include "omd/cli/commands/order_command.hpp"
#include "omd/cli/commands/prune_command.hpp"
#include "omd/cli/commands/remove_command.hpp"
#include "omd/cli/commands/show_command.hpp"
#include "omd/cli/commands/sub_command.hpp"

namespace omd::cli {

Application::Application()
    : app_("omd", "Edit frontmatter and inline metadata of markdown notes")
    , services_initialized_(false) {

  app_.set_version_flag("--version", omd::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);
  // Global flags are also accepted after the command name
  app_.fallthrough();

  setupGlobalOptions();
  setupCommands();
  setupHelp();
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

Result<void> Application::initialize() {
  if (!services_initialized_) {
    return initializeServices();
  }
  return {};
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

omd::config::Config& Application::config() {
  return config_;
}

omd::store::NoteStore& Application::noteStore() {
  return *note_store_;
}

void Application::printError(const util::ContextualError& error) const {
  auto& handler = util::ErrorHandler::instance();
  if (global_options_.json) {
    std::cout << handler.formatUserError(error, true) << "\n";
  } else {
    std::cerr << handler.formatUserError(error, false, !global_options_.no_color) << "\n";
  }
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output (-vv for trace)");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_flag("--no-color", global_options_.no_color, "Disable colored output");
}

void Application::setupCommands() {
  // Metadata edits
  registerCommand(std::make_unique<AddCommand>(*this));
  registerCommand(std::make_unique<RemoveCommand>(*this));
  registerCommand(std::make_unique<MoveCommand>(*this));
  registerCommand(std::make_unique<DedupeCommand>(*this));
  registerCommand(std::make_unique<OrderCommand>(*this));
  registerCommand(std::make_unique<PruneCommand>(*this));

  // Body edits
  registerCommand(std::make_unique<AppendCommand>(*this));
  registerCommand(std::make_unique<SubCommand>(*this));

  // Queries
  registerCommand(std::make_unique<GetCommand>(*this));
  registerCommand(std::make_unique<ShowCommand>(*this));

  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  omd add tags draft -n vault/                 # frontmatter by default
  omd add status active --kind inline -n vault/projects
  omd rm tags old --has tags=old -n vault/
  omd mv tags --from frontmatter --to inline -n note.md
  omd order --key-order asc --value-order asc -n vault/ --dry-run
  omd get tags --json -n vault/ --starts-with 2024-

For more information on a specific command, run:
  omd <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());
  cmd_ptr->setupCommand(sub);

  sub->callback([this, cmd_ptr]() {
    auto init_result = initialize();
    if (!init_result.has_value()) {
      printError(util::ContextualError(init_result.error(),
                                       util::ErrorContext{}.withOperation("initialize")));
      throw CLI::RuntimeError(1);
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      printError(util::ContextualError(result.error(),
                                       util::ErrorContext{}.withOperation(cmd_ptr->name())));
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

Result<void> Application::initializeServices() {
  auto config_result = omd::config::Config::fromFile(global_options_.config_file);
  if (!config_result.has_value()) {
    return std::unexpected(config_result.error());
  }
  config_ = std::move(*config_result);

  auto level = util::logLevelFromString(config_.logging.level);
  if (!level.has_value()) {
    return std::unexpected(level.error());
  }
  if (global_options_.verbose >= 2) {
    *level = spdlog::level::trace;
  } else if (global_options_.verbose == 1) {
    *level = spdlog::level::debug;
  } else if (global_options_.quiet) {
    *level = spdlog::level::err;
  }
  util::setupErrorHandling(*level, config_.logging.file);

  omd::store::FilesystemStore::Config store_config;
  store_config.extension = config_.defaults.extension;
  note_store_ = std::make_unique<omd::store::FilesystemStore>(store_config);

  spdlog::debug("omd {} using config {}", omd::getVersion().toString(),
                config_.path().empty() ? std::string("<defaults>") : config_.path().string());
  services_initialized_ = true;
  return {};
}

} // namespace omd::cli
