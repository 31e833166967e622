#include "omd/config/config.hpp"

#include <sstream>

#include <toml++/toml.hpp>

#include "omd/util/error_handler.hpp"
#include "omd/util/filesystem.hpp"
#include "omd/util/xdg.hpp"

namespace omd::config {

namespace {

// Enum parse failures surface as configuration errors
template <typename T>
Result<T> configValue(Result<T> parsed, const std::string& key) {
  if (!parsed.has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     key + ": " + parsed.error().message()));
  }
  return parsed;
}

Result<bool> parseBool(const std::string& value, const std::string& key) {
  if (value == "true" || value == "yes" || value == "1") return true;
  if (value == "false" || value == "no" || value == "0") return false;
  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   key + ": expected true or false, got '" + value + "'"));
}

std::vector<std::string> stringArray(const toml::array& array) {
  std::vector<std::string> values;
  for (const auto& item : array) {
    if (auto str = item.value<std::string>()) {
      values.push_back(*str);
    }
  }
  return values;
}

toml::array toTomlArray(const std::vector<std::string>& values) {
  toml::array array;
  for (const auto& value : values) {
    array.push_back(value);
  }
  return array;
}

std::string quoteList(const std::vector<std::string>& values) {
  std::string out = "[";
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) out += ", ";
    out += "\"" + values[i] + "\"";
  }
  return out + "]";
}

}  // namespace

Result<Config> Config::fromFile(const std::filesystem::path& config_path) {
  Config config;
  auto path = config_path.empty() ? defaultConfigPath() : config_path;
  if (config_path.empty() && !std::filesystem::exists(path)) {
    return config;
  }

  auto loaded = config.load(path);
  if (!loaded.has_value()) {
    return std::unexpected(loaded.error());
  }
  auto valid = config.validate();
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }
  return config;
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    // Composition
    if (auto compose_table = config_data["compose"].as_table()) {
      if (auto value = (*compose_table)["inline_position"].value<std::string>()) {
        auto parsed = configValue(core::inlinePositionFromString(*value), "compose.inline_position");
        if (!parsed.has_value()) return std::unexpected(parsed.error());
        compose.inline_position = *parsed;
      }
      if (auto value = (*compose_table)["inline_template"].value<std::string>()) {
        auto parsed = configValue(core::inlineTemplateFromString(*value), "compose.inline_template");
        if (!parsed.has_value()) return std::unexpected(parsed.error());
        compose.inline_template = *parsed;
      }
      if (auto value = (*compose_table)["inline_inplace"].value<bool>()) {
        compose.inline_inplace = *value;
      }
    }

    // Defaults
    if (auto defaults_table = config_data["defaults"].as_table()) {
      if (auto value = (*defaults_table)["kind"].value<std::string>()) {
        auto parsed = configValue(core::metadataKindFromString(*value), "defaults.kind");
        if (!parsed.has_value()) return std::unexpected(parsed.error());
        defaults.kind = *parsed;
      }
      if (auto value = (*defaults_table)["add_kind"].value<std::string>()) {
        auto parsed = configValue(core::metadataKindFromString(*value), "defaults.add_kind");
        if (!parsed.has_value()) return std::unexpected(parsed.error());
        defaults.add_kind = *parsed;
      }
      if (auto value = (*defaults_table)["recursive"].value<bool>()) {
        defaults.recursive = *value;
      }
      if (auto value = (*defaults_table)["extension"].value<std::string>()) {
        defaults.extension = *value;
      }
    }

    // Logging
    if (auto logging_table = config_data["logging"].as_table()) {
      if (auto value = (*logging_table)["level"].value<std::string>()) {
        logging.level = *value;
      }
      if (auto value = (*logging_table)["file"].value<bool>()) {
        logging.file = *value;
      }
    }

    // Per-field settings
    if (auto fields_table = config_data["fields"].as_table()) {
      for (const auto& [name, node] : *fields_table) {
        auto field_table = node.as_table();
        if (!field_table) {
          continue;
        }
        std::string key(name.str());
        FieldConfig field;
        if (auto array = (*field_table)["frontmatter_separators"].as_array()) {
          field.frontmatter_separators = stringArray(*array);
        }
        if (auto array = (*field_table)["inline_separators"].as_array()) {
          field.inline_separators = stringArray(*array);
        }
        if (auto value = (*field_table)["default_kind"].value<std::string>()) {
          auto parsed = configValue(core::metadataKindFromString(*value),
                                    "fields." + key + ".default_kind");
          if (!parsed.has_value()) return std::unexpected(parsed.error());
          field.default_kind = *parsed;
        }
        fields[key] = std::move(field);
      }
    }

    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;
  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  toml::table config_data;

  toml::table compose_table;
  compose_table.insert_or_assign("inline_position",
                                 std::string(core::inlinePositionToString(compose.inline_position)));
  compose_table.insert_or_assign("inline_template",
                                 std::string(core::inlineTemplateToString(compose.inline_template)));
  compose_table.insert_or_assign("inline_inplace", compose.inline_inplace);
  config_data.insert_or_assign("compose", std::move(compose_table));

  toml::table defaults_table;
  defaults_table.insert_or_assign("kind", std::string(core::metadataKindToString(defaults.kind)));
  defaults_table.insert_or_assign("add_kind",
                                  std::string(core::metadataKindToString(defaults.add_kind)));
  defaults_table.insert_or_assign("recursive", defaults.recursive);
  defaults_table.insert_or_assign("extension", defaults.extension);
  config_data.insert_or_assign("defaults", std::move(defaults_table));

  toml::table logging_table;
  logging_table.insert_or_assign("level", logging.level);
  logging_table.insert_or_assign("file", logging.file);
  config_data.insert_or_assign("logging", std::move(logging_table));

  if (!fields.empty()) {
    toml::table fields_table;
    for (const auto& [key, field] : fields) {
      toml::table field_table;
      if (!field.frontmatter_separators.empty()) {
        field_table.insert_or_assign("frontmatter_separators",
                                     toTomlArray(field.frontmatter_separators));
      }
      if (!field.inline_separators.empty()) {
        field_table.insert_or_assign("inline_separators", toTomlArray(field.inline_separators));
      }
      if (field.default_kind.has_value()) {
        field_table.insert_or_assign("default_kind",
                                     std::string(core::metadataKindToString(*field.default_kind)));
      }
      fields_table.insert_or_assign(key, std::move(field_table));
    }
    config_data.insert_or_assign("fields", std::move(fields_table));
  }

  std::stringstream ss;
  ss << config_data << "\n";
  auto write_result = util::FileSystem::writeFileAtomic(save_path, ss.str());
  if (!write_result.has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Cannot write config file: " + write_result.error().message()));
  }
  return {};
}

Result<std::string> Config::get(const std::string& key) const {
  return getValueByPath(splitPath(key));
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  return setValueByPath(splitPath(key), value);
}

Result<void> Config::validate() const {
  if (auto level = util::logLevelFromString(logging.level); !level.has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "logging.level: " + level.error().message()));
  }
  if (defaults.extension.empty() || defaults.extension.front() != '.') {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "defaults.extension must start with '.': " +
                                         defaults.extension));
  }
  for (const auto& [key, field] : fields) {
    if (field.default_kind == core::MetadataKind::kAll) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "fields." + key +
                                           ".default_kind must be frontmatter or inline"));
    }
    for (const auto* separators : {&field.frontmatter_separators, &field.inline_separators}) {
      for (const auto& separator : *separators) {
        if (separator.empty()) {
          return std::unexpected(makeError(ErrorCode::kConfigError,
                                           "fields." + key + ": empty separator"));
        }
      }
    }
  }
  return {};
}

std::filesystem::path Config::defaultConfigPath() {
  return util::Xdg::configFile();
}

core::ComposeOptions Config::composeOptions() const {
  core::ComposeOptions options;
  options.inline_position = compose.inline_position;
  options.inline_template = compose.inline_template;
  options.inline_inplace = compose.inline_inplace;
  return options;
}

core::ParseOptions Config::parseOptions() const {
  core::ParseOptions options;
  for (const auto& [key, field] : fields) {
    if (!field.frontmatter_separators.empty()) {
      options.frontmatter_separators[key] = field.frontmatter_separators;
    }
    if (!field.inline_separators.empty()) {
      options.inline_separators[key] = field.inline_separators;
    }
  }
  return options;
}

core::FieldDefaults Config::fieldDefaults() const {
  core::FieldDefaults result;
  for (const auto& [key, field] : fields) {
    if (field.default_kind.has_value()) {
      result[key] = *field.default_kind;
    }
  }
  return result;
}

Result<std::string> Config::getValueByPath(const std::vector<std::string>& path) const {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 2) {
    const auto& section = path[0];
    const auto& key = path[1];
    if (section == "compose") {
      if (key == "inline_position") return std::string(core::inlinePositionToString(compose.inline_position));
      if (key == "inline_template") return std::string(core::inlineTemplateToString(compose.inline_template));
      if (key == "inline_inplace") return std::string(compose.inline_inplace ? "true" : "false");
    } else if (section == "defaults") {
      if (key == "kind") return std::string(core::metadataKindToString(defaults.kind));
      if (key == "add_kind") return std::string(core::metadataKindToString(defaults.add_kind));
      if (key == "recursive") return std::string(defaults.recursive ? "true" : "false");
      if (key == "extension") return defaults.extension;
    } else if (section == "logging") {
      if (key == "level") return logging.level;
      if (key == "file") return std::string(logging.file ? "true" : "false");
    }
  } else if (path.size() == 3 && path[0] == "fields") {
    auto it = fields.find(path[1]);
    if (it == fields.end()) {
      return std::unexpected(makeError(ErrorCode::kNotFound, "No settings for field: " + path[1]));
    }
    const auto& field = it->second;
    if (path[2] == "frontmatter_separators") return quoteList(field.frontmatter_separators);
    if (path[2] == "inline_separators") return quoteList(field.inline_separators);
    if (path[2] == "default_kind") {
      return field.default_kind ? std::string(core::metadataKindToString(*field.default_kind))
                                : std::string();
    }
  }

  std::string joined;
  for (const auto& part : path) {
    joined += joined.empty() ? part : "." + part;
  }
  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + joined));
}

Result<void> Config::setValueByPath(const std::vector<std::string>& path, const std::string& value) {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  auto assign = [](auto parsed, auto& target) -> Result<void> {
    if (!parsed.has_value()) {
      return std::unexpected(parsed.error());
    }
    target = *parsed;
    return {};
  };

  if (path.size() == 2) {
    const auto& section = path[0];
    const auto& key = path[1];
    std::string dotted = section + "." + key;
    if (section == "compose") {
      if (key == "inline_position") {
        return assign(configValue(core::inlinePositionFromString(value), dotted), compose.inline_position);
      }
      if (key == "inline_template") {
        return assign(configValue(core::inlineTemplateFromString(value), dotted), compose.inline_template);
      }
      if (key == "inline_inplace") return assign(parseBool(value, dotted), compose.inline_inplace);
    } else if (section == "defaults") {
      if (key == "kind") {
        return assign(configValue(core::metadataKindFromString(value), dotted), defaults.kind);
      }
      if (key == "add_kind") {
        return assign(configValue(core::metadataKindFromString(value), dotted), defaults.add_kind);
      }
      if (key == "recursive") return assign(parseBool(value, dotted), defaults.recursive);
      if (key == "extension") { defaults.extension = value; return {}; }
    } else if (section == "logging") {
      if (key == "level") {
        auto level = util::logLevelFromString(value);
        if (!level.has_value()) {
          return std::unexpected(makeError(ErrorCode::kConfigError, level.error().message()));
        }
        logging.level = value;
        return {};
      }
      if (key == "file") return assign(parseBool(value, dotted), logging.file);
    }
  } else if (path.size() == 3 && path[0] == "fields" &&
             (path[2] == "frontmatter_separators" || path[2] == "inline_separators" ||
              path[2] == "default_kind")) {
    std::string dotted = "fields." + path[1] + "." + path[2];
    if (path[2] == "default_kind") {
      auto parsed = configValue(core::metadataKindFromString(value), dotted);
      if (!parsed.has_value()) return std::unexpected(parsed.error());
      fields[path[1]].default_kind = *parsed;
      return {};
    }
    // A single separator replaces the configured list
    if (path[2] == "frontmatter_separators") {
      fields[path[1]].frontmatter_separators = {value};
    } else {
      fields[path[1]].inline_separators = {value};
    }
    return {};
  }

  std::string joined;
  for (const auto& part : path) {
    joined += joined.empty() ? part : "." + part;
  }
  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown config key: " + joined));
}

std::vector<std::string> Config::splitPath(const std::string& path) const {
  std::vector<std::string> parts;
  std::istringstream stream(path);
  std::string part;

  while (std::getline(stream, part, '.')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }
  return parts;
}

}  // namespace omd::config
