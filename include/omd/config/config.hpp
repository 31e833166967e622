#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "omd/common.hpp"
#include "omd/core/content_composer.hpp"
#include "omd/core/metadata_kind.hpp"
#include "omd/core/note.hpp"
#include "omd/core/note_metadata.hpp"

namespace omd::config {

// Per-field settings from a [fields.<key>] table
struct FieldConfig {
  std::vector<std::string> frontmatter_separators;
  std::vector<std::string> inline_separators;
  std::optional<core::MetadataKind> default_kind;  // frontmatter or inline
};

// Configuration for the omd application
class Config {
 public:
  Config() = default;

  // Loads `config_path`, or the default file when empty. A missing default
  // file gives the built-in defaults; a missing explicit file is an error.
  static Result<Config> fromFile(const std::filesystem::path& config_path = {});

  // [compose]
  struct ComposeConfig {
    core::InlinePosition inline_position = core::InlinePosition::kBottom;
    core::InlineTemplate inline_template = core::InlineTemplate::kStandard;
    bool inline_inplace = true;
  };
  ComposeConfig compose;

  // [defaults]
  struct DefaultsConfig {
    core::MetadataKind kind = core::MetadataKind::kAll;             // queries and removals
    core::MetadataKind add_kind = core::MetadataKind::kFrontmatter; // new keys
    bool recursive = true;
    std::string extension = ".md";
  };
  DefaultsConfig defaults;

  // [logging]
  struct LoggingConfig {
    std::string level = "warn";
    bool file = false;
  };
  LoggingConfig logging;

  std::map<std::string, FieldConfig> fields;

  // Load configuration from file
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Get/set configuration values using dot notation
  Result<std::string> get(const std::string& key) const;
  Result<void> set(const std::string& key, const std::string& value);

  Result<void> validate() const;

  static std::filesystem::path defaultConfigPath();

  const std::filesystem::path& path() const noexcept { return config_path_; }

  // Settings in the shape the core consumes
  core::ComposeOptions composeOptions() const;
  core::ParseOptions parseOptions() const;
  core::FieldDefaults fieldDefaults() const;

 private:
  std::filesystem::path config_path_;

  Result<std::string> getValueByPath(const std::vector<std::string>& path) const;
  Result<void> setValueByPath(const std::vector<std::string>& path, const std::string& value);

  std::vector<std::string> splitPath(const std::string& path) const;
};

}  // namespace omd::config
