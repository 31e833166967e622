#pragma once

#include <string>

#include "omd/cli/note_command.hpp"

namespace omd::cli {

// Deletes keys that are declared without values
class PruneCommand : public MutatingCommand {
public:
  explicit PruneCommand(Application& app) : MutatingCommand(app) {}

  std::string name() const override { return "prune"; }
  std::string description() const override { return "Remove keys that have no values"; }

protected:
  void setupArguments(CLI::App* cmd) override;
  Result<void> prepare() override;
  Result<void> mutate(core::Note& note) override;

private:
  std::string kind_;
  core::MetadataKind resolved_kind_ = core::MetadataKind::kAll;
};

}  // namespace omd::cli
