#include "omd/cli/commands/config_command.hpp"

#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>

namespace omd::cli {

void ConfigCommand::setupCommand(CLI::App* cmd) {
  auto* get_cmd = cmd->add_subcommand("get", "Get configuration value");
  get_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  get_cmd->callback([this]() { mode_ = Mode::kGet; });

  auto* set_cmd = cmd->add_subcommand("set", "Set configuration value");
  set_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  set_cmd->add_option("value", value_, "Configuration value")->required();
  set_cmd->callback([this]() { mode_ = Mode::kSet; });

  auto* path_cmd = cmd->add_subcommand("path", "Show configuration file path");
  path_cmd->callback([this]() { mode_ = Mode::kPath; });

  auto* validate_cmd = cmd->add_subcommand("validate", "Validate current configuration");
  validate_cmd->callback([this]() { mode_ = Mode::kValidate; });

  cmd->require_subcommand(1);
}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  switch (mode_) {
    case Mode::kGet:
      return executeGet(options);
    case Mode::kSet:
      return executeSet(options);
    case Mode::kPath:
      return executePath(options);
    case Mode::kValidate:
      return executeValidate(options);
    case Mode::kNone:
      break;
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

Result<int> ConfigCommand::executeGet(const GlobalOptions& options) {
  auto value = app_.config().get(key_);
  if (!value.has_value()) {
    return std::unexpected(value.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["key"] = key_;
    output["value"] = *value;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << *value << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeSet(const GlobalOptions& options) {
  auto& config = app_.config();
  auto set = config.set(key_, value_);
  if (!set.has_value()) {
    return std::unexpected(set.error());
  }
  auto valid = config.validate();
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }

  std::filesystem::path target = options.config_file.empty()
                                     ? std::filesystem::path{}
                                     : std::filesystem::path(options.config_file);
  auto saved = config.save(target);
  if (!saved.has_value()) {
    return std::unexpected(saved.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["success"] = true;
    output["key"] = key_;
    output["value"] = value_;
    std::cout << output.dump(2) << "\n";
  } else if (!options.quiet) {
    std::cout << "Configuration updated: " << key_ << " = " << value_ << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executePath(const GlobalOptions& options) {
  auto config_path = options.config_file.empty() ? config::Config::defaultConfigPath()
                                                 : std::filesystem::path(options.config_file);
  std::error_code ec;
  bool exists = std::filesystem::exists(config_path, ec);

  if (options.json) {
    nlohmann::json output;
    output["config_path"] = config_path.string();
    output["exists"] = exists;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << config_path.string() << (exists ? "" : " (not found, using defaults)") << "\n";
  }
  return 0;
}

Result<int> ConfigCommand::executeValidate(const GlobalOptions& options) {
  auto valid = app_.config().validate();

  if (options.json) {
    nlohmann::json output;
    output["valid"] = valid.has_value();
    if (!valid.has_value()) {
      output["error"] = valid.error().message();
    }
    std::cout << output.dump(2) << "\n";
  } else if (valid.has_value()) {
    std::cout << "Configuration is valid\n";
  } else {
    std::cout << "Configuration is invalid: " << valid.error().message() << "\n";
  }
  return valid.has_value() ? 0 : 1;
}

}  // namespace omd::cli
