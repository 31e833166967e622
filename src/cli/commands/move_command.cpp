#include "omd/cli/commands/move_command.hpp"

#include <algorithm>

namespace omd::cli {

namespace {

core::MetadataKind opposite(core::MetadataKind kind) {
  return kind == core::MetadataKind::kFrontmatter ? core::MetadataKind::kInline
                                                  : core::MetadataKind::kFrontmatter;
}

}  // namespace

void MoveCommand::setupArguments(CLI::App* cmd) {
  cmd->add_option("keys", keys_, "Keys to move (default: all keys of the source)");
  cmd->add_option("--from", from_, "Source: frontmatter or inline")
      ->check(CLI::IsMember({"frontmatter", "fm", "inline"}));
  cmd->add_option("--to", to_, "Destination: frontmatter or inline")
      ->check(CLI::IsMember({"frontmatter", "fm", "inline"}));
}

Result<void> MoveCommand::prepare() {
  if (from_.empty() && to_.empty()) {
    defaults_ = app_.config().fieldDefaults();
    if (!keys_.empty()) {
      std::erase_if(defaults_, [this](const auto& entry) {
        return std::find(keys_.begin(), keys_.end(), entry.first) == keys_.end();
      });
    }
    if (defaults_.empty()) {
      return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                       "No --from/--to given and no field has a configured "
                                       "default_kind"));
    }
    return {};
  }

  std::optional<core::MetadataKind> from;
  std::optional<core::MetadataKind> to;
  if (!from_.empty()) {
    auto parsed = core::metadataKindFromString(from_);
    if (!parsed.has_value()) return std::unexpected(parsed.error());
    from = *parsed;
  }
  if (!to_.empty()) {
    auto parsed = core::metadataKindFromString(to_);
    if (!parsed.has_value()) return std::unexpected(parsed.error());
    to = *parsed;
  }
  if (!from) from = opposite(*to);
  if (!to) to = opposite(*from);
  direction_ = std::make_pair(*from, *to);
  return {};
}

Result<void> MoveCommand::mutate(core::Note& note) {
  if (direction_.has_value()) {
    return note.move(keys_, direction_->first, direction_->second);
  }
  return note.moveToDefaults(defaults_);
}

}  // namespace omd::cli
