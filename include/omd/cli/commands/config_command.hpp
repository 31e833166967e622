#pragma once

#include <string>

#include "omd/cli/application.hpp"
#include "omd/common.hpp"

namespace omd::cli {

/**
 * Command for managing configuration
 *
 * Subcommands:
 * - get <key>: Print a configuration value
 * - set <key> <value>: Change a value and save the file
 * - path: Show the configuration file path
 * - validate: Validate the loaded configuration
 */
class ConfigCommand : public Command {
public:
  explicit ConfigCommand(Application& app) : app_(app) {}

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "config"; }
  std::string description() const override { return "Manage configuration settings"; }

private:
  enum class Mode { kNone, kGet, kSet, kPath, kValidate };

  Application& app_;
  Mode mode_ = Mode::kNone;

  std::string key_;
  std::string value_;

  Result<int> executeGet(const GlobalOptions& options);
  Result<int> executeSet(const GlobalOptions& options);
  Result<int> executePath(const GlobalOptions& options);
  Result<int> executeValidate(const GlobalOptions& options);
};

}  // namespace omd::cli
