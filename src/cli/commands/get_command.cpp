#include "omd/cli/commands/get_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace omd::cli {

void GetCommand::setupArguments(CLI::App* cmd) {
  cmd->add_option("key", key_, "Metadata key")->required();
  cmd->add_option("-k,--kind", kind_, "frontmatter, inline or all (default from config)");
  cmd->add_flag("--missing", missing_, "Also list notes that do not have the key");
}

Result<int> GetCommand::execute(const GlobalOptions& options) {
  auto kind = parseKind(kind_, app_.config().defaults.kind);
  if (!kind.has_value()) {
    return std::unexpected(kind.error());
  }

  store::NoteBatch batch(app_.noteStore(), app_.config().parseOptions());
  auto loaded = loadNotes(batch);
  if (!loaded.has_value()) {
    return std::unexpected(loaded.error());
  }

  nlohmann::json output = nlohmann::json::array();
  for (const auto& note : batch.notes()) {
    auto values = note.get(key_, *kind);
    if (!values.has_value() && !missing_) {
      continue;
    }

    if (options.json) {
      nlohmann::json entry;
      entry["path"] = note.path().string();
      entry["key"] = key_;
      entry["values"] = values.has_value() ? nlohmann::json(*values) : nlohmann::json(nullptr);
      output.push_back(std::move(entry));
    } else if (values.has_value()) {
      std::cout << note.path().string() << ": " << core::joinValues(*values) << "\n";
    } else {
      std::cout << note.path().string() << ": <missing>\n";
    }
  }

  if (options.json) {
    std::cout << output.dump(2) << "\n";
  }
  printFailures(batch.failures());
  return batch.failures().empty() ? 0 : 1;
}

}  // namespace omd::cli
