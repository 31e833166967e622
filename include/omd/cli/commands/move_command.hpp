#pragma once

#include <optional>
#include <string>
#include <vector>

#include "omd/cli/note_command.hpp"

namespace omd::cli {

// Moves keys between frontmatter and inline fields. Without --from/--to
// every key with a configured default kind is moved there.
class MoveCommand : public MutatingCommand {
public:
  explicit MoveCommand(Application& app) : MutatingCommand(app) {}

  std::string name() const override { return "mv"; }
  std::string description() const override { return "Move keys between frontmatter and inline fields"; }

protected:
  void setupArguments(CLI::App* cmd) override;
  Result<void> prepare() override;
  Result<void> mutate(core::Note& note) override;

private:
  std::vector<std::string> keys_;
  std::string from_;
  std::string to_;

  std::optional<std::pair<core::MetadataKind, core::MetadataKind>> direction_;
  core::FieldDefaults defaults_;
};

}  // namespace omd::cli
