#include "omd/cli/commands/append_command.hpp"

namespace omd::cli {

void AppendCommand::setupArguments(CLI::App* cmd) {
  cmd->add_option("text", text_, "Text to append")->required();
  cmd->add_flag("--allow-repeat", allow_repeat_, "Append even when the text already occurs");
}

Result<void> AppendCommand::mutate(core::Note& note) {
  return note.append(text_, allow_repeat_);
}

}  // namespace omd::cli
