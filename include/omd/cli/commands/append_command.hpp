#pragma once

#include <string>

#include "omd/cli/note_command.hpp"

namespace omd::cli {

class AppendCommand : public MutatingCommand {
public:
  explicit AppendCommand(Application& app) : MutatingCommand(app) {}

  std::string name() const override { return "append"; }
  std::string description() const override { return "Append text to the end of notes"; }

protected:
  void setupArguments(CLI::App* cmd) override;
  Result<void> mutate(core::Note& note) override;

private:
  std::string text_;
  bool allow_repeat_ = false;
};

}  // namespace omd::cli
