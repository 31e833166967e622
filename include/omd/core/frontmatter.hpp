#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "omd/common.hpp"
#include "omd/core/metadata_store.hpp"

namespace omd::core {

// Structural split of a note around its header block. Only a `---` line
// at the very start of the text (after an optional UTF-8 BOM) opens a
// block; the block ends at the next `---` line.
struct FrontmatterSplit {
  std::string preamble;                 // bytes before the opening delimiter
  std::optional<std::string> block;     // raw block, delimiters included
  std::string yaml;                     // text between the delimiters
  std::string body;                     // everything after the block
  bool unterminated = false;            // opening delimiter without a closing one
};

// YAML header metadata block ("frontmatter")
class Frontmatter {
 public:
  Frontmatter() = default;
  Frontmatter(MetadataStore store, bool exists)
      : store_(std::move(store)), exists_(exists) {}

  // Parses the header of a full note text. A note without a header parses
  // to an empty store. A broken header (no closing delimiter, invalid
  // YAML, non-mapping top level, nested mapping value) is
  // ErrorCode::kInvalidFrontmatter.
  static Result<Frontmatter> parse(std::string_view note_text,
                                   const SeparatorRules& separators = {});

  static FrontmatterSplit split(std::string_view note_text);

  // Renders `key: value`, block lists, and bare `key:` lines between
  // delimiters. An empty store renders to an empty string.
  static std::string toString(const MetadataStore& store);
  std::string toString() const { return toString(store_); }

  // Note text without its header block
  static std::string erase(std::string_view note_text);

  // True iff the parsed text carried a structurally valid block
  bool exists() const noexcept { return exists_; }

  MetadataStore& store() noexcept { return store_; }
  const MetadataStore& store() const noexcept { return store_; }

 private:
  MetadataStore store_;
  bool exists_ = false;
};

}  // namespace omd::core
