#pragma once

#include <string>

#include "omd/cli/note_command.hpp"

namespace omd::cli {

/**
 * @brief Prints the values of one key for every selected note
 */
class GetCommand : public NoteCommand {
public:
  explicit GetCommand(Application& app) : NoteCommand(app) {}

  std::string name() const override { return "get"; }
  std::string description() const override { return "Print the values of a key"; }

  Result<int> execute(const GlobalOptions& options) override;

protected:
  void setupArguments(CLI::App* cmd) override;

private:
  std::string key_;
  std::string kind_;
  bool missing_ = false;
};

}  // namespace omd::cli
