#include "omd/cli/commands/prune_command.hpp"

namespace omd::cli {

void PruneCommand::setupArguments(CLI::App* cmd) {
  cmd->add_option("-k,--kind", kind_, "frontmatter, inline or all (default from config)");
}

Result<void> PruneCommand::prepare() {
  auto kind = parseKind(kind_, app_.config().defaults.kind);
  if (!kind.has_value()) {
    return std::unexpected(kind.error());
  }
  resolved_kind_ = *kind;
  return {};
}

Result<void> PruneCommand::mutate(core::Note& note) {
  return note.removeEmpty(resolved_kind_);
}

}  // namespace omd::cli
