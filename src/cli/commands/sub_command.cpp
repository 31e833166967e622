#include "omd/cli/commands/sub_command.hpp"

namespace omd::cli {

void SubCommand::setupArguments(CLI::App* cmd) {
  cmd->add_option("pattern", pattern_, "Text (or regex with --regex) to replace")->required();
  cmd->add_option("replacement", replacement_, "Replacement text ($1 refers to a group)")->required();
  cmd->add_flag("-r,--regex", regex_, "Treat the pattern as a regular expression");
}

Result<void> SubCommand::mutate(core::Note& note) {
  return note.sub(pattern_, replacement_, regex_);
}

}  // namespace omd::cli
