#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "omd/cli/application.hpp"
#include "omd/core/content_composer.hpp"
#include "omd/core/metadata_kind.hpp"
#include "omd/core/note.hpp"
#include "omd/store/note_batch.hpp"
#include "omd/store/note_query.hpp"

namespace omd::cli {

// Which notes a command works on
struct NoteSelection {
  std::vector<std::string> paths;
  std::string starts_with;
  std::string ends_with;
  std::string pattern;
  std::vector<std::string> has;   // key[=v1,v2][@kind]
  bool no_recursive = false;

  void addOptions(CLI::App* cmd);
  Result<store::QueryOptions> queryOptions(core::MetadataKind default_kind) const;
};

// Composition overrides for commands that rewrite notes
struct ComposeFlags {
  bool dry_run = false;
  std::string position;
  std::string inline_template;
  bool inplace = true;
  CLI::Option* inplace_option = nullptr;

  void addOptions(CLI::App* cmd);

  // Config values with the flags given on the command line applied on top
  Result<core::ComposeOptions> resolve(const config::Config& config) const;
};

// Parses a --kind value; empty selects the fallback
Result<core::MetadataKind> parseKind(const std::string& value, core::MetadataKind fallback);

/**
 * @brief Base for commands that run over a selection of notes
 */
class NoteCommand : public Command {
public:
  explicit NoteCommand(Application& app) : app_(app) {}

  void setupCommand(CLI::App* cmd) override;

protected:
  Application& app_;
  NoteSelection selection_;

  // Command-specific arguments and options
  virtual void setupArguments(CLI::App* cmd) = 0;

  // Loads the selection into `batch` and drops notes the query rejects
  Result<void> loadNotes(store::NoteBatch& batch) const;

  void printFailures(const std::vector<store::BatchFailure>& failures) const;
};

/**
 * @brief Base for commands that change notes and write them back
 */
class MutatingCommand : public NoteCommand {
public:
  explicit MutatingCommand(Application& app) : NoteCommand(app) {}

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

protected:
  ComposeFlags compose_;

  // Validates arguments once, before any note is loaded
  virtual Result<void> prepare() { return {}; }

  virtual Result<void> mutate(core::Note& note) = 0;

private:
  void printReport(const store::BatchReport& report, const GlobalOptions& options) const;
};

}  // namespace omd::cli
