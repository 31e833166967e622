#include "omd/cli/note_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace omd::cli {

void NoteSelection::addOptions(CLI::App* cmd) {
  cmd->add_option("-n,--notes", paths, "Note files or directories (default: current directory)");
  cmd->add_option("--starts-with", starts_with, "Keep notes whose file name starts with the text");
  cmd->add_option("--ends-with", ends_with, "Keep notes whose file name ends with the text");
  cmd->add_option("--pattern", pattern, "Keep notes whose file name matches the regex");
  cmd->add_option("--has", has, "Keep notes having metadata: key[=v1,v2][@kind] (repeatable)");
  cmd->add_flag("--no-recursive", no_recursive, "Do not descend into sub-directories");
}

Result<store::QueryOptions> NoteSelection::queryOptions(core::MetadataKind default_kind) const {
  store::QueryOptions options;
  if (!starts_with.empty()) options.starts_with = starts_with;
  if (!ends_with.empty()) options.ends_with = ends_with;
  if (!pattern.empty()) options.pattern = pattern;

  for (const auto& condition : has) {
    auto predicate = store::MetadataPredicate::parse(condition, default_kind);
    if (!predicate.has_value()) {
      return std::unexpected(predicate.error());
    }
    options.has_meta.push_back(std::move(*predicate));
  }
  return options;
}

void ComposeFlags::addOptions(CLI::App* cmd) {
  cmd->add_flag("--dry-run", dry_run, "Report the notes that would change without writing");
  cmd->add_option("--position", position, "Where new inline fields go")
      ->check(CLI::IsMember({"top", "bottom"}));
  cmd->add_option("--template", inline_template, "Layout of a new inline block")
      ->check(CLI::IsMember({"standard", "callout"}));
  inplace_option = cmd->add_flag("--inplace,!--no-inplace", inplace,
                                 "Rewrite inline fields where they are (default from config)");
}

Result<core::ComposeOptions> ComposeFlags::resolve(const config::Config& config) const {
  auto options = config.composeOptions();
  if (!position.empty()) {
    auto parsed = core::inlinePositionFromString(position);
    if (!parsed.has_value()) {
      return std::unexpected(parsed.error());
    }
    options.inline_position = *parsed;
  }
  if (!inline_template.empty()) {
    auto parsed = core::inlineTemplateFromString(inline_template);
    if (!parsed.has_value()) {
      return std::unexpected(parsed.error());
    }
    options.inline_template = *parsed;
  }
  if (inplace_option != nullptr && inplace_option->count() > 0) {
    options.inline_inplace = inplace;
  }
  return options;
}

Result<core::MetadataKind> parseKind(const std::string& value, core::MetadataKind fallback) {
  if (value.empty()) {
    return fallback;
  }
  return core::metadataKindFromString(value);
}

void NoteCommand::setupCommand(CLI::App* cmd) {
  setupArguments(cmd);
  selection_.addOptions(cmd);
}

Result<void> NoteCommand::loadNotes(store::NoteBatch& batch) const {
  auto query_options = selection_.queryOptions(app_.config().defaults.kind);
  if (!query_options.has_value()) {
    return std::unexpected(query_options.error());
  }
  auto query = store::NoteQuery::compile(std::move(*query_options));
  if (!query.has_value()) {
    return std::unexpected(query.error());
  }

  std::vector<std::filesystem::path> roots;
  for (const auto& path : selection_.paths) {
    roots.emplace_back(path);
  }
  if (roots.empty()) {
    roots.emplace_back(".");
  }

  bool recursive = app_.config().defaults.recursive && !selection_.no_recursive;
  auto loaded = batch.load(roots, recursive);
  if (!loaded.has_value()) {
    return loaded;
  }
  batch.filter(*query);
  return {};
}

void NoteCommand::printFailures(const std::vector<store::BatchFailure>& failures) const {
  if (app_.globalOptions().json) {
    return;
  }
  for (const auto& failure : failures) {
    auto context = util::ErrorContext{}.withFile(failure.path.string()).withOperation(failure.operation);
    app_.printError(util::ContextualError(failure.error, context, util::ErrorSeverity::kWarning));
  }
}

void MutatingCommand::setupCommand(CLI::App* cmd) {
  NoteCommand::setupCommand(cmd);
  compose_.addOptions(cmd);
}

Result<int> MutatingCommand::execute(const GlobalOptions& options) {
  auto prepared = prepare();
  if (!prepared.has_value()) {
    return std::unexpected(prepared.error());
  }
  auto compose_options = compose_.resolve(app_.config());
  if (!compose_options.has_value()) {
    return std::unexpected(compose_options.error());
  }

  store::NoteBatch batch(app_.noteStore(), app_.config().parseOptions());
  auto loaded = loadNotes(batch);
  if (!loaded.has_value()) {
    return std::unexpected(loaded.error());
  }

  batch.apply(name(), [this](core::Note& note) { return mutate(note); });
  auto report = batch.commit(*compose_options, compose_.dry_run);

  printReport(report, options);
  return report.ok() ? 0 : 1;
}

void MutatingCommand::printReport(const store::BatchReport& report,
                                  const GlobalOptions& options) const {
  if (options.json) {
    nlohmann::json output;
    output["command"] = name();
    output["dry_run"] = compose_.dry_run;
    output["processed"] = report.processed;

    nlohmann::json changed = nlohmann::json::array();
    for (const auto& path : report.changed) {
      changed.push_back(path.string());
    }
    output["changed"] = changed;

    nlohmann::json written = nlohmann::json::array();
    for (const auto& path : report.written) {
      written.push_back(path.string());
    }
    output["written"] = written;

    nlohmann::json failures = nlohmann::json::array();
    for (const auto& failure : report.failures) {
      failures.push_back({
          {"path", failure.path.string()},
          {"operation", failure.operation},
          {"code", std::string(errorCodeToString(failure.error.code()))},
          {"message", failure.error.message()},
      });
    }
    output["failures"] = failures;

    std::cout << output.dump(2) << "\n";
    return;
  }

  printFailures(report.failures);
  if (options.quiet) {
    return;
  }
  for (const auto& path : report.changed) {
    std::cout << (compose_.dry_run ? "would update " : "updated ") << path.string() << "\n";
  }
  if (options.verbose > 0) {
    std::cout << report.processed << " notes processed, " << report.changed.size()
              << " changed, " << report.failures.size() << " failed\n";
  }
}

}  // namespace omd::cli
