#include "omd/cli/commands/dedupe_command.hpp"

namespace omd::cli {

void DedupeCommand::setupArguments(CLI::App* cmd) {
  cmd->add_option("keys", keys_, "Keys to deduplicate (default: all)");
  cmd->add_option("-k,--kind", kind_, "frontmatter, inline or all (default from config)");
}

Result<void> DedupeCommand::prepare() {
  auto kind = parseKind(kind_, app_.config().defaults.kind);
  if (!kind.has_value()) {
    return std::unexpected(kind.error());
  }
  resolved_kind_ = *kind;
  return {};
}

Result<void> DedupeCommand::mutate(core::Note& note) {
  return note.removeDuplicateValues(keys_, resolved_kind_);
}

}  // namespace omd::cli
