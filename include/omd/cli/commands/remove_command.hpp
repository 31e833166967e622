#pragma once

#include <string>
#include <vector>

#include "omd/cli/note_command.hpp"

namespace omd::cli {

class RemoveCommand : public MutatingCommand {
public:
  explicit RemoveCommand(Application& app) : MutatingCommand(app) {}

  std::string name() const override { return "rm"; }
  std::string description() const override { return "Remove a key, or some of its values, from notes"; }

protected:
  void setupArguments(CLI::App* cmd) override;
  Result<void> prepare() override;
  Result<void> mutate(core::Note& note) override;

private:
  std::string key_;
  std::vector<std::string> values_;
  std::string kind_;
  core::MetadataKind resolved_kind_ = core::MetadataKind::kAll;
};

}  // namespace omd::cli
