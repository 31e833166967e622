#pragma once

#include <string>

#include "omd/cli/note_command.hpp"

namespace omd::cli {

class SubCommand : public MutatingCommand {
public:
  explicit SubCommand(Application& app) : MutatingCommand(app) {}

  std::string name() const override { return "sub"; }
  std::string description() const override { return "Replace text in note bodies"; }

protected:
  void setupArguments(CLI::App* cmd) override;
  Result<void> mutate(core::Note& note) override;

private:
  std::string pattern_;
  std::string replacement_;
  bool regex_ = false;
};

}  // namespace omd::cli
