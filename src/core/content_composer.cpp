#include "omd/core/content_composer.hpp"

#include <algorithm>
#include <unordered_set>

#include "omd/core/frontmatter.hpp"

namespace omd::core {

namespace {

bool isQuotedLine(std::string_view line) noexcept {
  auto start = line.find_first_not_of(" \t");
  return start != std::string_view::npos && line[start] == '>';
}

std::string trimLeadingBlankLines(std::string_view text) {
  auto lines = splitLines(text);
  auto first = std::find_if(lines.begin(), lines.end(),
                            [](const std::string& line) { return !isBlankLine(line); });
  lines.erase(lines.begin(), first);
  return joinLines(lines);
}

std::string trimTrailingBlankLines(std::string_view text) {
  auto lines = splitLines(text);
  while (!lines.empty() && isBlankLine(lines.back())) {
    lines.pop_back();
  }
  return joinLines(lines);
}

std::string renderFieldLine(const InlineField& field, const Values& values) {
  std::string line = field.prefix + field.key + " ::";
  if (!values.empty()) {
    line += " " + joinValues(values);
  }
  if (field.carriage_return) {
    line += '\r';
  }
  return line;
}

// Removes a field from its line. Text before the key stays in place; the
// line is marked dropped when nothing else was on it.
bool dropField(const InlineField& field, std::vector<std::string>& lines,
               std::vector<bool>& dropped) {
  auto lead = InlineMetadata::leadIn(field.prefix);
  if (lead.empty()) {
    dropped[field.line] = true;
    return true;
  }
  lines[field.line] = field.carriage_return ? lead + '\r' : lead;
  return false;
}

}  // namespace

std::string_view inlinePositionToString(InlinePosition position) noexcept {
  switch (position) {
    case InlinePosition::kTop: return "top";
    case InlinePosition::kBottom: return "bottom";
  }
  return "bottom";
}

Result<InlinePosition> inlinePositionFromString(std::string_view str) {
  if (str == "top") return InlinePosition::kTop;
  if (str == "bottom") return InlinePosition::kBottom;
  return makeErrorResult<InlinePosition>(ErrorCode::kInvalidArgument,
                                         "Unknown inline position: " + std::string(str));
}

std::string ContentComposer::compose(const NoteMetadata& metadata,
                                     const NoteSegments& segments) const {
  return segments.preamble + Frontmatter::toString(metadata.frontmatter()) +
         composeBody(metadata.inlineFields(), segments);
}

std::string ContentComposer::composeBody(const MetadataStore& inline_fields,
                                         const NoteSegments& segments) const {
  if (!options_.inline_inplace) {
    auto body = InlineMetadata::erase(segments.body);
    return insertBlock(body, InlineMetadata::toString(inline_fields, options_.inline_template));
  }

  std::vector<std::string> written;
  auto body = rewriteInPlace(inline_fields, segments, written);
  return insertBlock(body,
                     InlineMetadata::toString(inline_fields, options_.inline_template, written));
}

std::string ContentComposer::rewriteInPlace(const MetadataStore& inline_fields,
                                            const NoteSegments& segments,
                                            std::vector<std::string>& written) const {
  auto lines = splitLines(segments.body);
  std::vector<bool> dropped(lines.size(), false);

  // Values as they were parsed across all lines of each key
  MetadataStore original;
  for (const auto& field : segments.inline_fields) {
    original.add(field.key, field.values);
  }
  original.splitValues(segments.inline_separators);

  std::unordered_set<std::string> placed;
  bool any_dropped = false;
  for (const auto& field : segments.inline_fields) {
    if (field.line >= lines.size()) {
      continue;
    }
    auto values = inline_fields.get(field.key);
    if (!values.has_value()) {
      any_dropped |= dropField(field, lines, dropped);
      continue;
    }
    if (values == original.get(field.key)) {
      // Unchanged key: every line stays as written
      if (placed.insert(field.key).second) {
        written.push_back(field.key);
      }
      continue;
    }
    if (!placed.insert(field.key).second) {
      any_dropped |= dropField(field, lines, dropped);
      continue;
    }
    lines[field.line] = renderFieldLine(field, *values);
    written.push_back(field.key);
  }

  if (!any_dropped) {
    return joinLines(lines);
  }

  std::vector<std::string> kept;
  kept.reserve(lines.size());
  bool removed = false;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (dropped[i]) {
      removed = true;
      continue;
    }
    if (isBlankLine(lines[i])) {
      if (removed && (kept.empty() || isBlankLine(kept.back()))) {
        continue;
      }
    } else {
      removed = false;
    }
    kept.push_back(std::move(lines[i]));
  }

  // Callout headers whose fields are all gone
  for (size_t i = 0; i < kept.size();) {
    bool orphan = InlineMetadata::isCalloutHeader(kept[i]) &&
                  (i + 1 == kept.size() || !isQuotedLine(kept[i + 1]));
    if (orphan) {
      kept.erase(kept.begin() + static_cast<std::ptrdiff_t>(i));
      if (i < kept.size() && isBlankLine(kept[i]) && (i == 0 || isBlankLine(kept[i - 1]))) {
        kept.erase(kept.begin() + static_cast<std::ptrdiff_t>(i));
      }
    } else {
      ++i;
    }
  }
  return joinLines(kept);
}

std::string ContentComposer::insertBlock(const std::string& body, const std::string& block) const {
  if (block.empty()) {
    return body;
  }
  if (options_.inline_position == InlinePosition::kTop) {
    auto rest = trimLeadingBlankLines(body);
    return rest.empty() ? block + "\n" : block + "\n\n" + rest;
  }
  auto head = trimTrailingBlankLines(body);
  return head.empty() ? block + "\n" : head + "\n\n" + block + "\n";
}

}  // namespace omd::core
