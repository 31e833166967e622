#pragma once

#include <string>
#include <vector>

#include "omd/cli/note_command.hpp"

namespace omd::cli {

class AddCommand : public MutatingCommand {
public:
  explicit AddCommand(Application& app) : MutatingCommand(app) {}

  std::string name() const override { return "add"; }
  std::string description() const override { return "Add a key or values to notes"; }

protected:
  void setupArguments(CLI::App* cmd) override;
  Result<void> prepare() override;
  Result<void> mutate(core::Note& note) override;

private:
  std::string key_;
  std::vector<std::string> values_;
  std::string kind_;
  bool overwrite_ = false;
  core::MetadataKind resolved_kind_ = core::MetadataKind::kFrontmatter;
};

}  // namespace omd::cli
