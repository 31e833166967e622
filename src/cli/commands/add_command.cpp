#include "omd/cli/commands/add_command.hpp"

namespace omd::cli {

void AddCommand::setupArguments(CLI::App* cmd) {
  cmd->add_option("key", key_, "Metadata key")->required();
  cmd->add_option("values", values_, "Values to add (none declares an empty key)");
  cmd->add_option("-k,--kind", kind_, "frontmatter, inline or all (default from config)");
  cmd->add_flag("--overwrite", overwrite_, "Replace existing values instead of appending");
}

Result<void> AddCommand::prepare() {
  auto kind = parseKind(kind_, app_.config().defaults.add_kind);
  if (!kind.has_value()) {
    return std::unexpected(kind.error());
  }
  resolved_kind_ = *kind;
  return {};
}

Result<void> AddCommand::mutate(core::Note& note) {
  std::optional<core::Values> values;
  if (!values_.empty()) {
    values = values_;
  }
  return note.add(key_, values, resolved_kind_, overwrite_);
}

}  // namespace omd::cli
