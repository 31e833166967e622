#include "omd/cli/commands/order_command.hpp"

namespace omd::cli {

void OrderCommand::setupArguments(CLI::App* cmd) {
  cmd->add_option("keys", keys_, "Keys whose values are sorted (default: all)");
  cmd->add_option("--key-order", key_order_, "Sort keys: asc or desc")
      ->check(CLI::IsMember({"asc", "desc"}));
  cmd->add_option("--value-order", value_order_, "Sort values: asc or desc")
      ->check(CLI::IsMember({"asc", "desc"}));
  cmd->add_option("-k,--kind", kind_, "frontmatter, inline or all (default from config)");
}

Result<void> OrderCommand::prepare() {
  if (key_order_.empty() && value_order_.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Give --key-order and/or --value-order"));
  }
  if (!key_order_.empty()) {
    auto order = core::orderFromString(key_order_);
    if (!order.has_value()) return std::unexpected(order.error());
    resolved_key_order_ = *order;
  }
  if (!value_order_.empty()) {
    auto order = core::orderFromString(value_order_);
    if (!order.has_value()) return std::unexpected(order.error());
    resolved_value_order_ = *order;
  }

  auto kind = parseKind(kind_, app_.config().defaults.kind);
  if (!kind.has_value()) {
    return std::unexpected(kind.error());
  }
  resolved_kind_ = *kind;
  return {};
}

Result<void> OrderCommand::mutate(core::Note& note) {
  return note.order(keys_, resolved_key_order_, resolved_value_order_, resolved_kind_);
}

}  // namespace omd::cli
