#include "omd/core/frontmatter.hpp"

#include <yaml-cpp/yaml.h>

namespace omd::core {

namespace {

constexpr std::string_view kDelimiter = "---";
constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

// Line content without its terminator; `next` receives the offset of the
// following line (or npos at end of text).
std::string_view lineAt(std::string_view text, size_t start, size_t& next) {
  auto end = text.find('\n', start);
  next = end == std::string_view::npos ? std::string_view::npos : end + 1;
  auto line = text.substr(start, end == std::string_view::npos ? std::string_view::npos
                                                               : end - start);
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return line;
}

std::string nodeToString(const YAML::Node& node) {
  if (node.IsNull()) {
    return "";
  }
  if (node.IsScalar()) {
    return node.Scalar();
  }
  YAML::Emitter emitter;
  emitter << YAML::Flow << node;
  return emitter.c_str();
}

std::string emitScalar(const std::string& value) {
  YAML::Emitter emitter;
  emitter << value;
  return emitter.c_str();
}

}  // namespace

FrontmatterSplit Frontmatter::split(std::string_view note_text) {
  FrontmatterSplit parts;

  size_t start = 0;
  if (note_text.starts_with(kUtf8Bom)) {
    parts.preamble = std::string(kUtf8Bom);
    start = kUtf8Bom.size();
  }

  size_t next = 0;
  if (start >= note_text.size() || lineAt(note_text, start, next) != kDelimiter) {
    parts.body = std::string(note_text.substr(start));
    return parts;
  }

  size_t yaml_start = next;
  while (next != std::string_view::npos && next < note_text.size()) {
    size_t line_start = next;
    auto line = lineAt(note_text, line_start, next);
    if (line == kDelimiter) {
      size_t block_end = next == std::string_view::npos ? note_text.size() : next;
      parts.block = std::string(note_text.substr(start, block_end - start));
      parts.yaml = std::string(note_text.substr(yaml_start, line_start - yaml_start));
      parts.body = std::string(note_text.substr(block_end));
      return parts;
    }
  }

  // Opening delimiter without a closing one
  parts.block = std::string(note_text.substr(start));
  parts.body = std::string(note_text.substr(start));
  parts.unterminated = true;
  return parts;
}

Result<Frontmatter> Frontmatter::parse(std::string_view note_text,
                                       const SeparatorRules& separators) {
  auto parts = split(note_text);
  if (!parts.block.has_value()) {
    return Frontmatter{};
  }
  if (parts.unterminated) {
    return std::unexpected(makeError(ErrorCode::kInvalidFrontmatter,
                                     "Frontmatter block is not closed by a '---' line"));
  }

  MetadataStore store;
  try {
    YAML::Node root = YAML::Load(parts.yaml);

    if (root.IsNull()) {
      return Frontmatter(std::move(store), true);
    }
    if (!root.IsMap()) {
      return std::unexpected(makeError(ErrorCode::kInvalidFrontmatter,
                                       "Frontmatter top level is not a key/value mapping"));
    }

    for (const auto& pair : root) {
      if (!pair.first.IsScalar()) {
        return std::unexpected(makeError(ErrorCode::kInvalidFrontmatter,
                                         "Frontmatter keys must be plain scalars"));
      }
      std::string key = pair.first.Scalar();
      const YAML::Node& value = pair.second;

      Values values;
      if (value.IsNull()) {
        // declared without values
      } else if (value.IsScalar()) {
        values.push_back(value.Scalar());
      } else if (value.IsSequence()) {
        values.reserve(value.size());
        for (const auto& element : value) {
          values.push_back(nodeToString(element));
        }
      } else {
        return std::unexpected(makeError(ErrorCode::kInvalidFrontmatter,
                                         "Frontmatter field '" + key + "' is a nested mapping"));
      }
      store.add(key, values);
    }
  } catch (const YAML::Exception& e) {
    return std::unexpected(makeError(ErrorCode::kInvalidFrontmatter,
                                     "YAML parse error: " + std::string(e.what())));
  }

  store.splitValues(separators);
  return Frontmatter(std::move(store), true);
}

std::string Frontmatter::toString(const MetadataStore& store) {
  if (store.empty()) {
    return "";
  }

  std::string out = "---\n";
  for (const auto& [key, values] : store) {
    out += emitScalar(key);
    if (values.empty()) {
      out += ":\n";
    } else if (values.size() == 1) {
      out += ": " + emitScalar(values.front()) + "\n";
    } else {
      out += ":\n";
      for (const auto& value : values) {
        out += "  - " + emitScalar(value) + "\n";
      }
    }
  }
  out += "---\n";
  return out;
}

std::string Frontmatter::erase(std::string_view note_text) {
  auto parts = split(note_text);
  if (!parts.block.has_value() || parts.unterminated) {
    return std::string(note_text);
  }
  return parts.preamble + parts.body;
}

}  // namespace omd::core
