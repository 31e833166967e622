#include "omd/cli/commands/show_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace omd::cli {

namespace {

nlohmann::ordered_json storeToJson(const core::MetadataStore& store) {
  nlohmann::ordered_json object = nlohmann::ordered_json::object();
  for (const auto& [key, values] : store) {
    object[key] = values;
  }
  return object;
}

void printStore(std::string_view label, const core::MetadataStore& store) {
  std::cout << "  " << label << ":";
  if (store.empty()) {
    std::cout << " (none)\n";
    return;
  }
  std::cout << "\n";
  for (const auto& [key, values] : store) {
    std::cout << "    " << key << ": " << core::joinValues(values) << "\n";
  }
}

}  // namespace

void ShowCommand::setupArguments(CLI::App* cmd) {
  cmd->add_option("-k,--kind", kind_, "frontmatter, inline or all (default: all)");
  cmd->add_flag("--content", content_, "Also print the note text");
}

Result<int> ShowCommand::execute(const GlobalOptions& options) {
  auto kind = parseKind(kind_, core::MetadataKind::kAll);
  if (!kind.has_value()) {
    return std::unexpected(kind.error());
  }
  bool with_frontmatter = *kind != core::MetadataKind::kInline;
  bool with_inline = *kind != core::MetadataKind::kFrontmatter;

  store::NoteBatch batch(app_.noteStore(), app_.config().parseOptions());
  auto loaded = loadNotes(batch);
  if (!loaded.has_value()) {
    return std::unexpected(loaded.error());
  }

  nlohmann::ordered_json output = nlohmann::ordered_json::object();
  for (const auto& note : batch.notes()) {
    const auto& metadata = note.metadata();

    if (options.json) {
      nlohmann::ordered_json entry;
      if (with_frontmatter) entry["frontmatter"] = storeToJson(metadata.frontmatter());
      if (with_inline) entry["inline"] = storeToJson(metadata.inlineFields());
      if (content_) entry["content"] = note.content();
      output[note.path().string()] = std::move(entry);
      continue;
    }

    std::cout << note.path().string() << "\n";
    if (with_frontmatter) printStore("frontmatter", metadata.frontmatter());
    if (with_inline) printStore("inline", metadata.inlineFields());
    if (content_) {
      std::cout << "---- content ----\n" << note.content();
      if (!note.content().empty() && note.content().back() != '\n') {
        std::cout << "\n";
      }
    }
  }

  if (options.json) {
    std::cout << output.dump(2) << "\n";
  }
  printFailures(batch.failures());
  return batch.failures().empty() ? 0 : 1;
}

}  // namespace omd::cli
