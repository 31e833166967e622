#pragma once

#include <string>
#include <vector>

#include "omd/cli/note_command.hpp"

namespace omd::cli {

class DedupeCommand : public MutatingCommand {
public:
  explicit DedupeCommand(Application& app) : MutatingCommand(app) {}

  std::string name() const override { return "dedupe"; }
  std::string description() const override { return "Drop repeated values, keeping the first occurrence"; }

protected:
  void setupArguments(CLI::App* cmd) override;
  Result<void> prepare() override;
  Result<void> mutate(core::Note& note) override;

private:
  std::vector<std::string> keys_;
  std::string kind_;
  core::MetadataKind resolved_kind_ = core::MetadataKind::kAll;
};

}  // namespace omd::cli
