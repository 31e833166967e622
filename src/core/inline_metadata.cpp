#include "omd/core/inline_metadata.hpp"

#include <algorithm>
#include <regex>

namespace omd::core {

namespace {

// prefix: any lead-in before the key (indentation, quote or list markers, text)
// key:    letter, digit or underscore first, then those plus hyphens and spaces
const std::regex& fieldRegex() {
  static const std::regex regex(R"((.*?)([A-Za-z0-9_][A-Za-z0-9_ \-]*?)[ \t]*::(.*))");
  return regex;
}

// Bracketed fields such as `[key:: value]` or `(key:: value)` are left alone
const std::regex& enclosedRegex() {
  static const std::regex regex(R"([(\[].*?::.*?[)\]])");
  return regex;
}

std::string_view stripCarriageReturn(std::string_view line, bool& had_cr) {
  had_cr = !line.empty() && line.back() == '\r';
  if (had_cr) {
    line.remove_suffix(1);
  }
  return line;
}

}  // namespace

std::string_view inlineTemplateToString(InlineTemplate tml) noexcept {
  switch (tml) {
    case InlineTemplate::kStandard: return "standard";
    case InlineTemplate::kCallout: return "callout";
  }
  return "standard";
}

Result<InlineTemplate> inlineTemplateFromString(std::string_view str) {
  if (str == "standard") return InlineTemplate::kStandard;
  if (str == "callout") return InlineTemplate::kCallout;
  return makeErrorResult<InlineTemplate>(ErrorCode::kInvalidArgument,
                                         "Unknown inline template: " + std::string(str));
}

std::optional<InlineField> InlineMetadata::matchLine(std::string_view line) {
  bool had_cr = false;
  line = stripCarriageReturn(line, had_cr);

  std::match_results<std::string_view::const_iterator> match;
  if (!std::regex_match(line.begin(), line.end(), match, fieldRegex()) ||
      std::regex_search(line.begin(), line.end(), enclosedRegex())) {
    return std::nullopt;
  }

  InlineField field;
  field.prefix = match[1].str();
  field.key = match[2].str();
  field.values = splitValues(std::string_view(match[3].first, match[3].second));
  field.carriage_return = had_cr;
  return field;
}

bool InlineMetadata::isCalloutHeader(std::string_view line) noexcept {
  auto end = line.find_last_not_of(" \t\r");
  if (end == std::string_view::npos) {
    return false;
  }
  auto start = line.find_first_not_of(" \t");
  return line.substr(start, end - start + 1) == kCalloutHeader;
}

std::string InlineMetadata::leadIn(std::string_view prefix) {
  auto end = prefix.find_last_not_of(" \t");
  if (end == std::string_view::npos) {
    return "";
  }
  auto text = prefix.substr(0, end + 1);

  size_t pos = text.find_first_not_of(" \t>");
  if (pos == std::string_view::npos) {
    return "";
  }
  auto rest = text.substr(pos);
  if (rest.size() == 1 && (rest[0] == '-' || rest[0] == '*' || rest[0] == '+')) {
    return "";
  }
  if (rest.size() >= 2 && (rest[0] == '-' || rest[0] == '*' || rest[0] == '+') &&
      (rest[1] == ' ' || rest[1] == '\t')) {
    rest.remove_prefix(2);
  } else {
    size_t digits = 0;
    while (digits < rest.size() && rest[digits] >= '0' && rest[digits] <= '9') {
      ++digits;
    }
    if (digits > 0 && digits < rest.size() && (rest[digits] == '.' || rest[digits] == ')') &&
        (digits + 1 == rest.size() || rest[digits + 1] == ' ' || rest[digits + 1] == '\t')) {
      rest.remove_prefix(std::min(digits + 2, rest.size()));
    }
  }
  auto start = rest.find_first_not_of(" \t");
  rest = start == std::string_view::npos ? std::string_view{} : rest.substr(start);
  if (rest == "[ ]" || rest == "[x]" || rest == "[X]") {
    return "";
  }
  return rest.empty() ? std::string() : std::string(text);
}

std::vector<InlineField> InlineMetadata::scan(std::string_view body) {
  std::vector<InlineField> fields;
  auto lines = splitLines(body);
  for (size_t i = 0; i < lines.size(); ++i) {
    auto field = matchLine(lines[i]);
    if (field.has_value()) {
      field->line = i;
      fields.push_back(std::move(*field));
    }
  }
  return fields;
}

InlineMetadata InlineMetadata::parse(std::string_view body, const SeparatorRules& separators) {
  InlineMetadata metadata;
  for (const auto& field : scan(body)) {
    metadata.store_.add(field.key, field.values);
    metadata.exists_ = true;
  }
  metadata.store_.splitValues(separators);
  return metadata;
}

std::string InlineMetadata::toString(const MetadataStore& store, InlineTemplate tml,
                                     const std::vector<std::string>& skip) {
  std::vector<std::string> lines;
  for (const auto& [key, values] : store) {
    if (std::find(skip.begin(), skip.end(), key) != skip.end()) {
      continue;
    }
    std::string rendered = values.empty() ? std::string() : " " + joinValues(values);
    if (tml == InlineTemplate::kCallout) {
      lines.push_back("> " + key + " ::" + rendered);
    } else {
      lines.push_back(key + "::" + rendered);
    }
  }
  if (lines.empty()) {
    return "";
  }
  if (tml == InlineTemplate::kCallout) {
    lines.insert(lines.begin(), std::string(kCalloutHeader));
  }
  return joinLines(lines);
}

std::string InlineMetadata::erase(std::string_view body) {
  auto lines = splitLines(body);
  std::vector<std::string> kept;
  kept.reserve(lines.size());

  bool removed = false;
  for (auto& line : lines) {
    auto field = matchLine(line);
    if (field.has_value()) {
      auto lead = leadIn(field->prefix);
      if (lead.empty()) {
        removed = true;
        continue;
      }
      line = field->carriage_return ? lead + '\r' : lead;
    } else if (isCalloutHeader(line)) {
      removed = true;
      continue;
    }
    if (isBlankLine(line)) {
      if (removed && (kept.empty() || isBlankLine(kept.back()))) {
        continue;
      }
    } else {
      removed = false;
    }
    kept.push_back(std::move(line));
  }
  return joinLines(kept);
}

std::vector<std::string> splitLines(std::string_view text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (true) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) {
      lines.emplace_back(text.substr(start));
      break;
    }
    lines.emplace_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

std::string joinLines(const std::vector<std::string>& lines) {
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      out += '\n';
    }
    out += lines[i];
  }
  return out;
}

bool isBlankLine(std::string_view line) noexcept {
  return line.find_first_not_of(" \t\r") == std::string_view::npos;
}

}  // namespace omd::core
