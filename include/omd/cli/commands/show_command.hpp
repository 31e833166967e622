#pragma once

#include <string>

#include "omd/cli/note_command.hpp"

namespace omd::cli {

/**
 * @brief Prints the parsed metadata of every selected note
 */
class ShowCommand : public NoteCommand {
public:
  explicit ShowCommand(Application& app) : NoteCommand(app) {}

  std::string name() const override { return "show"; }
  std::string description() const override { return "Show the metadata of notes"; }

  Result<int> execute(const GlobalOptions& options) override;

protected:
  void setupArguments(CLI::App* cmd) override;

private:
  std::string kind_;
  bool content_ = false;
};

}  // namespace omd::cli
