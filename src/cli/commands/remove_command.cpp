#include "omd/cli/commands/remove_command.hpp"

namespace omd::cli {

void RemoveCommand::setupArguments(CLI::App* cmd) {
  cmd->add_option("key", key_, "Metadata key")->required();
  cmd->add_option("values", values_, "Values to remove (none removes the key)");
  cmd->add_option("-k,--kind", kind_, "frontmatter, inline or all (default from config)");
}

Result<void> RemoveCommand::prepare() {
  auto kind = parseKind(kind_, app_.config().defaults.kind);
  if (!kind.has_value()) {
    return std::unexpected(kind.error());
  }
  resolved_kind_ = *kind;
  return {};
}

Result<void> RemoveCommand::mutate(core::Note& note) {
  std::optional<core::Values> values;
  if (!values_.empty()) {
    values = values_;
  }
  return note.remove(key_, values, resolved_kind_);
}

}  // namespace omd::cli
