#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "omd/core/metadata_store.hpp"

namespace omd::core {

// Layout used when inline fields are rendered as a fresh block
enum class InlineTemplate {
  kStandard,  // one bare `key:: values` line per key
  kCallout    // fields quoted inside a collapsed callout
};

std::string_view inlineTemplateToString(InlineTemplate tml) noexcept;
Result<InlineTemplate> inlineTemplateFromString(std::string_view str);

// One recognized `key :: values` line of a note body
struct InlineField {
  size_t line = 0;              // zero-based line index within the body
  std::string prefix;           // everything on the line before the key
  std::string key;
  Values values;
  bool carriage_return = false; // line ended with "\r\n"
};

// Dataview-style inline fields scattered through the note body
class InlineMetadata {
 public:
  static constexpr std::string_view kCalloutHeader = "> [!info]- metadata";

  InlineMetadata() = default;
  explicit InlineMetadata(MetadataStore store) : store_(std::move(store)) {}

  // Collects every field of the body. Keys keep first-seen order and
  // values keep occurrence order across the whole document.
  static InlineMetadata parse(std::string_view body, const SeparatorRules& separators = {});

  // Locates the field lines of a body
  static std::vector<InlineField> scan(std::string_view body);

  // Matches a single line (without its terminator)
  static std::optional<InlineField> matchLine(std::string_view line);

  static bool isCalloutHeader(std::string_view line) noexcept;

  // Text of a field's prefix that must survive removal of the field, with
  // trailing blanks cut. Empty when the prefix holds only indentation,
  // quote markers, a list marker or a task box.
  static std::string leadIn(std::string_view prefix);

  // One line per key in store order; keys listed in `skip` are left out
  static std::string toString(const MetadataStore& store,
                              InlineTemplate tml = InlineTemplate::kStandard,
                              const std::vector<std::string>& skip = {});
  std::string toString(InlineTemplate tml = InlineTemplate::kStandard) const {
    return toString(store_, tml);
  }

  // Removes every field line (and callout header); text before a key is
  // kept on its own line. Blank runs left behind collapse to a single blank line.
  static std::string erase(std::string_view body);

  // True iff at least one field was matched
  bool exists() const noexcept { return exists_; }

  MetadataStore& store() noexcept { return store_; }
  const MetadataStore& store() const noexcept { return store_; }

 private:
  MetadataStore store_;
  bool exists_ = false;
};

// Line helpers shared with the composer
std::vector<std::string> splitLines(std::string_view text);
std::string joinLines(const std::vector<std::string>& lines);
bool isBlankLine(std::string_view line) noexcept;

}  // namespace omd::core
