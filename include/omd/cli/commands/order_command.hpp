#pragma once

#include <optional>
#include <string>
#include <vector>

#include "omd/cli/note_command.hpp"

namespace omd::cli {

class OrderCommand : public MutatingCommand {
public:
  explicit OrderCommand(Application& app) : MutatingCommand(app) {}

  std::string name() const override { return "order"; }
  std::string description() const override { return "Sort keys and/or values"; }

protected:
  void setupArguments(CLI::App* cmd) override;
  Result<void> prepare() override;
  Result<void> mutate(core::Note& note) override;

private:
  std::vector<std::string> keys_;
  std::string key_order_;
  std::string value_order_;
  std::string kind_;

  std::optional<core::Order> resolved_key_order_;
  std::optional<core::Order> resolved_value_order_;
  core::MetadataKind resolved_kind_ = core::MetadataKind::kAll;
};

}  // namespace omd::cli
